#pragma once

/// @file entity_factory.hpp
/// @brief Creation of the player, ghosts and collectibles.
///
/// Each factory places the entity at the center of the given cell and
/// attaches the component set that entity kind always carries.

#include "pacsim/game/game_config.hpp"
#include "pacsim/game/world.hpp"

namespace pacsim::game {

/// Position, Velocity (idle, player speed), PlayerControlled, Collider.
Entity CreatePlayer(World& world, GridPoint cell, const GameConfig& config = GameConfig{});

/// Position, Velocity (idle, ghost speed), GhostAI (scatter toward its
/// corner), Collider, Respawnable (spawn = @p cell).
Entity CreateGhost(World& world, GhostType type, GridPoint cell,
                   const GameConfig& config = GameConfig{});

/// Position, Edible, Collider.
Entity CreatePellet(World& world, GridPoint cell, const GameConfig& config = GameConfig{});

/// Position, Edible, PowerUp, Collider.
Entity CreatePowerPellet(World& world, GridPoint cell, const GameConfig& config = GameConfig{});

/// Populate @p world from its maze: player, four ghosts, every pellet
/// and power pellet.
void PopulateWorld(World& world, const GameConfig& config = GameConfig{});

} // namespace pacsim::game
