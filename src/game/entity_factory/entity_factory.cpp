/// @file entity_factory.cpp
/// @brief Entity factories.

#include "pacsim/game/entity_factory.hpp"

namespace pacsim::game {

Entity CreatePlayer(World& world, GridPoint cell, const GameConfig& config) {
    auto& registry = world.GetRegistry();
    auto entity = registry.Create();
    registry.Add(entity, Position::AtCell(cell.x, cell.y));
    registry.Add(entity, Velocity{std::nullopt, config.playerSpeed, std::nullopt});
    registry.Add(entity, PlayerControlled{});
    registry.Add(entity, Collider{});
    return entity;
}

Entity CreateGhost(World& world, GhostType type, GridPoint cell, const GameConfig& config) {
    auto& registry = world.GetRegistry();
    auto entity = registry.Create();
    registry.Add(entity, Position::AtCell(cell.x, cell.y));
    registry.Add(entity, Velocity{std::nullopt, config.ghostSpeed, std::nullopt});
    registry.Add(entity,
                 GhostAI{type, GhostMode::Scatter, world.GetMaze().ScatterCorner(type)});
    registry.Add(entity, Collider{});
    registry.Add(entity, Respawnable{cell.x, cell.y, config.ghostRespawnDelay, 0.0f});
    return entity;
}

Entity CreatePellet(World& world, GridPoint cell, const GameConfig& config) {
    auto& registry = world.GetRegistry();
    auto entity = registry.Create();
    registry.Add(entity, Position::AtCell(cell.x, cell.y));
    registry.Add(entity, Edible{config.pelletPoints});
    registry.Add(entity, Collider{});
    return entity;
}

Entity CreatePowerPellet(World& world, GridPoint cell, const GameConfig& config) {
    auto& registry = world.GetRegistry();
    auto entity = registry.Create();
    registry.Add(entity, Position::AtCell(cell.x, cell.y));
    registry.Add(entity, Edible{config.powerPelletPoints});
    registry.Add(entity, PowerUp{config.powerUpDuration});
    registry.Add(entity, Collider{});
    return entity;
}

void PopulateWorld(World& world, const GameConfig& config) {
    const auto& maze = world.GetMaze();

    CreatePlayer(world, maze.PlayerStart(), config);
    for (auto type : kAllGhostTypes) {
        CreateGhost(world, type, maze.GhostStart(type), config);
    }
    for (const auto& cell : maze.Pellets()) {
        CreatePellet(world, cell, config);
    }
    for (const auto& cell : maze.PowerPellets()) {
        CreatePowerPellet(world, cell, config);
    }
}

} // namespace pacsim::game
