#include <gtest/gtest.h>

#include "pacsim/game/entity_factory.hpp"
#include "pacsim/game/selectors.hpp"

using namespace pacsim::game;

class SelectorsTest : public ::testing::Test {
protected:
    World world_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Player
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SelectorsTest, NoPlayer) {
    EXPECT_FALSE(GetPlayerEntity(world_).has_value());
    EXPECT_FALSE(GetPlayerPosition(world_).has_value());
    EXPECT_FALSE(GetPlayerDirection(world_).has_value());
    EXPECT_FLOAT_EQ(GetPlayerSpeed(world_), 0.0f);
    EXPECT_FALSE(IsPlayerAlive(world_));
}

TEST_F(SelectorsTest, PlayerAccessors) {
    auto player = CreatePlayer(world_, {3, 5});
    world_.GetRegistry().Get<Velocity>(player)->direction = Direction::Right;

    EXPECT_EQ(GetPlayerEntity(world_), player);
    EXPECT_EQ(GetPlayerPosition(world_)->Cell(), (GridPoint{3, 5}));
    EXPECT_EQ(GetPlayerDirection(world_), Direction::Right);
    EXPECT_FLOAT_EQ(GetPlayerSpeed(world_), 2.0f);
    EXPECT_TRUE(IsPlayerAlive(world_));

    world_.GetRegistry().Destroy(player);
    EXPECT_FALSE(IsPlayerAlive(world_));
}

TEST_F(SelectorsTest, LowestIdPlayerWins) {
    auto first = CreatePlayer(world_, {1, 1});
    (void)CreatePlayer(world_, {2, 1});
    EXPECT_EQ(GetPlayerEntity(world_), first);
}

// ═══════════════════════════════════════════════════════════════════════════
// Ghosts
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SelectorsTest, GhostEntitiesOrderedById) {
    auto clyde = CreateGhost(world_, GhostType::Clyde, {16, 14});
    auto blinky = CreateGhost(world_, GhostType::Blinky, {14, 11});

    auto ghosts = GetGhostEntities(world_);
    ASSERT_EQ(ghosts.size(), 2u);
    EXPECT_EQ(ghosts[0], clyde);
    EXPECT_EQ(ghosts[1], blinky);

    EXPECT_EQ(FindGhostByType(world_, GhostType::Blinky), blinky);
    EXPECT_FALSE(FindGhostByType(world_, GhostType::Pinky).has_value());
    EXPECT_EQ(GetGhostType(world_, clyde), GhostType::Clyde);
    EXPECT_EQ(GetGhostMode(world_, clyde), GhostMode::Scatter);
}

TEST_F(SelectorsTest, GhostQueriesOnUnknownEntityAreEmpty) {
    Entity stranger(999);
    EXPECT_FALSE(GetGhostPosition(world_, stranger).has_value());
    EXPECT_FALSE(GetGhostMode(world_, stranger).has_value());
    EXPECT_FALSE(GetGhostType(world_, stranger).has_value());
    EXPECT_FALSE(IsGhostVulnerable(world_, stranger));
    EXPECT_FALSE(IsGhostFlashing(world_, stranger));
}

TEST_F(SelectorsTest, VulnerabilityNeedsTimeLeft) {
    auto ghost = CreateGhost(world_, GhostType::Pinky, {14, 14});
    auto& registry = world_.GetRegistry();

    registry.Add(ghost, Vulnerable{0.0f, false});
    EXPECT_FALSE(IsGhostVulnerable(world_, ghost));

    registry.Add(ghost, Vulnerable{500.0f, true});
    EXPECT_TRUE(IsGhostVulnerable(world_, ghost));
    EXPECT_TRUE(IsGhostFlashing(world_, ghost));
}

TEST_F(SelectorsTest, AllGhostStates) {
    auto blinky = CreateGhost(world_, GhostType::Blinky, {14, 11});
    auto inky = CreateGhost(world_, GhostType::Inky, {12, 14});
    world_.GetRegistry().Add(inky, Vulnerable{1000.0f, false});

    auto states = GetAllGhostStates(world_);
    ASSERT_EQ(states.size(), 2u);
    EXPECT_EQ(states[0].entity, blinky);
    EXPECT_EQ(states[0].type, GhostType::Blinky);
    EXPECT_FALSE(states[0].vulnerable);
    EXPECT_EQ(states[0].position.Cell(), (GridPoint{14, 11}));
    EXPECT_EQ(states[1].entity, inky);
    EXPECT_TRUE(states[1].vulnerable);
    EXPECT_FALSE(states[1].flashing);
}

// ═══════════════════════════════════════════════════════════════════════════
// Collectibles and session
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SelectorsTest, Collectibles) {
    auto a = CreatePellet(world_, {1, 1});
    auto p = CreatePowerPellet(world_, {1, 3});
    auto b = CreatePellet(world_, {2, 1});

    EXPECT_EQ(GetAllPellets(world_), (std::vector<Entity>{a, p, b}));
    EXPECT_EQ(GetPowerPellets(world_), (std::vector<Entity>{p}));
    EXPECT_EQ(GetRemainingPelletCount(world_), 3u);

    world_.GetRegistry().Destroy(a);
    EXPECT_EQ(GetRemainingPelletCount(world_), 2u);
}

TEST_F(SelectorsTest, SessionFlags) {
    EXPECT_TRUE(IsReady(world_));
    world_.SetState(GameState::Playing);
    EXPECT_TRUE(IsPlaying(world_));
    world_.SetState(GameState::Paused);
    EXPECT_TRUE(IsPaused(world_));
    world_.SetState(GameState::Won);
    EXPECT_TRUE(IsGameWon(world_));
    world_.SetState(GameState::Lost);
    EXPECT_TRUE(IsGameOver(world_));
    EXPECT_EQ(GetGameState(world_), GameState::Lost);

    world_.SetPowerUpTime(250.0f);
    EXPECT_TRUE(IsPowerUpActive(world_));
    EXPECT_FLOAT_EQ(GetPowerUpTimeRemaining(world_), 250.0f);
    EXPECT_EQ(GetScore(world_), 0);
    EXPECT_EQ(GetLives(world_), 3);
    EXPECT_EQ(GetLevel(world_), 1);
}
