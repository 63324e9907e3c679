#pragma once

/// @file components.hpp
/// @brief ECS components of the simulation and the registry built from them.
///
/// Components are plain data.  Timers are in milliseconds, positions in
/// pixels with the derived grid cell kept alongside.

#include <optional>

#include "pacsim/ecs/entity.hpp"
#include "pacsim/ecs/registry.hpp"
#include "pacsim/game/types.hpp"

namespace pacsim::game {

using ecs::Entity;

/// Pixel position plus the cell it falls in.
///
/// gridX/gridY are always floor(pixel / kTileSize); writers recompute them
/// after every pixel change.
struct Position {
    int gridX = 0;
    int gridY = 0;
    float pixelX = 0.0f;
    float pixelY = 0.0f;

    /// Position at the exact center of cell (x, y).
    static Position AtCell(int x, int y) {
        return Position{x, y, CellCenter(x), CellCenter(y)};
    }

    [[nodiscard]] GridPoint Cell() const { return {gridX, gridY}; }
};

struct Velocity {
    /// Direction currently applied.
    std::optional<Direction> direction;

    /// Pixels per reference frame.
    float speed = 0.0f;

    /// Queued turn, applied at the next legal moment.
    std::optional<Direction> nextDirection;
};

struct GhostAI {
    GhostType type = GhostType::Blinky;
    GhostMode mode = GhostMode::Scatter;
    GridPoint scatterTarget;
};

/// Present on anything the player can eat.
struct Edible {
    int points = 0;
};

/// Present on power pellets alongside Edible.
struct PowerUp {
    float duration = 0.0f;
};

/// Present while a ghost can be eaten.
struct Vulnerable {
    float remainingTime = 0.0f;
    bool flashing = false;
};

/// Spawn data used when positions are reset.
struct Respawnable {
    int spawnX = 0;
    int spawnY = 0;
    float delay = 3000.0f;
    float timer = 0.0f;
};

/// Marker for the single player entity.
struct PlayerControlled {};

/// Bounding box.  Collision currently uses center distance instead.
struct Collider {
    float width = static_cast<float>(kTileSize);
    float height = static_cast<float>(kTileSize);
};

/// Registry over the closed component set of the simulation.
using Registry = ecs::Registry<Position, Velocity, GhostAI, Edible, PowerUp,
                               Vulnerable, Respawnable, PlayerControlled, Collider>;

}  // namespace pacsim::game
