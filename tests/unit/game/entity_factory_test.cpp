#include <gtest/gtest.h>

#include "pacsim/game/entity_factory.hpp"
#include "pacsim/game/selectors.hpp"

using namespace pacsim::game;

// ═══════════════════════════════════════════════════════════════════════════
// Individual factories
// ═══════════════════════════════════════════════════════════════════════════

TEST(EntityFactoryTest, PlayerComponents) {
    World world;
    auto player = CreatePlayer(world, {14, 22});
    const auto& registry = world.GetRegistry();

    ASSERT_TRUE(registry.Has<PlayerControlled>(player));
    ASSERT_TRUE(registry.Has<Collider>(player));
    const auto* pos = registry.Get<Position>(player);
    ASSERT_NE(pos, nullptr);
    EXPECT_EQ(pos->Cell(), (GridPoint{14, 22}));
    EXPECT_FLOAT_EQ(pos->pixelX, 290.0f);
    EXPECT_FLOAT_EQ(pos->pixelY, 450.0f);

    const auto* vel = registry.Get<Velocity>(player);
    ASSERT_NE(vel, nullptr);
    EXPECT_FALSE(vel->direction.has_value());
    EXPECT_FALSE(vel->nextDirection.has_value());
    EXPECT_FLOAT_EQ(vel->speed, 2.0f);
}

TEST(EntityFactoryTest, GhostComponents) {
    World world;
    auto ghost = CreateGhost(world, GhostType::Inky, {12, 14});
    const auto& registry = world.GetRegistry();

    const auto* ai = registry.Get<GhostAI>(ghost);
    ASSERT_NE(ai, nullptr);
    EXPECT_EQ(ai->type, GhostType::Inky);
    EXPECT_EQ(ai->mode, GhostMode::Scatter);
    EXPECT_EQ(ai->scatterTarget, (GridPoint{27, 30}));

    const auto* spawn = registry.Get<Respawnable>(ghost);
    ASSERT_NE(spawn, nullptr);
    EXPECT_EQ(spawn->spawnX, 12);
    EXPECT_EQ(spawn->spawnY, 14);
    EXPECT_FLOAT_EQ(spawn->delay, 3000.0f);

    EXPECT_FLOAT_EQ(registry.Get<Velocity>(ghost)->speed, 1.5f);
    EXPECT_FALSE(registry.Has<Vulnerable>(ghost));
    EXPECT_FALSE(registry.Has<PlayerControlled>(ghost));
}

TEST(EntityFactoryTest, PelletAndPowerPellet) {
    World world;
    auto pellet = CreatePellet(world, {5, 5});
    auto power = CreatePowerPellet(world, {1, 3});
    const auto& registry = world.GetRegistry();

    EXPECT_EQ(registry.Get<Edible>(pellet)->points, 10);
    EXPECT_FALSE(registry.Has<PowerUp>(pellet));

    EXPECT_EQ(registry.Get<Edible>(power)->points, 50);
    ASSERT_TRUE(registry.Has<PowerUp>(power));
    EXPECT_FLOAT_EQ(registry.Get<PowerUp>(power)->duration, 6000.0f);
}

TEST(EntityFactoryTest, ConfigOverridesValues) {
    GameConfig config;
    config.playerSpeed = 3.0f;
    config.pelletPoints = 25;
    config.powerUpDuration = 4000.0f;

    World world;
    auto player = CreatePlayer(world, {1, 1}, config);
    auto pellet = CreatePellet(world, {2, 1}, config);
    auto power = CreatePowerPellet(world, {3, 1}, config);

    const auto& registry = world.GetRegistry();
    EXPECT_FLOAT_EQ(registry.Get<Velocity>(player)->speed, 3.0f);
    EXPECT_EQ(registry.Get<Edible>(pellet)->points, 25);
    EXPECT_FLOAT_EQ(registry.Get<PowerUp>(power)->duration, 4000.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// PopulateWorld
// ═══════════════════════════════════════════════════════════════════════════

TEST(EntityFactoryTest, PopulateWorldCreatesFullCast) {
    World world;
    PopulateWorld(world);
    const auto& maze = world.GetMaze();

    ASSERT_TRUE(GetPlayerEntity(world).has_value());
    EXPECT_EQ(world.GetRegistry().QueryEntities<PlayerControlled>().size(), 1u);
    EXPECT_EQ(GetPlayerPosition(world)->Cell(), maze.PlayerStart());

    auto ghosts = GetGhostEntities(world);
    ASSERT_EQ(ghosts.size(), 4u);
    for (auto type : kAllGhostTypes) {
        auto ghost = FindGhostByType(world, type);
        ASSERT_TRUE(ghost.has_value()) << ToString(type);
        EXPECT_EQ(GetGhostPosition(world, *ghost)->Cell(), maze.GhostStart(type));
    }

    EXPECT_EQ(GetRemainingPelletCount(world),
              maze.Pellets().size() + maze.PowerPellets().size());
    EXPECT_EQ(GetPowerPellets(world).size(), 4u);
    EXPECT_EQ(world.GetRegistry().Count(),
              1u + 4u + maze.Pellets().size() + maze.PowerPellets().size());
}
