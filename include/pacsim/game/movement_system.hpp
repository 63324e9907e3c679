#pragma once

/// @file movement_system.hpp
/// @brief MovementSystem: sub-pixel motion on the maze grid.

#include <string_view>

#include "pacsim/game/game_system.hpp"

namespace pacsim::game {

/// Advances every entity holding Position and Velocity.
///
/// Per entity and tick:
///   1. Grid cell is re-derived from the pixel position.
///   2. A queued reversal is applied at once; any other queued turn waits
///      until the entity is within kTurnTolerance of its cell center and
///      the cell ahead is walkable, then snaps to the center.
///   3. The entity moves speed * dt / kReferenceFrameMs pixels.  On the
///      tunnel row the x coordinate wraps around the maze width.
///   4. If the leading edge would enter an unwalkable cell the move is
///      cancelled and the entity is snapped to its cell center.
///
/// Nothing moves unless the game is Playing and dt is non-zero.
class MovementSystem final : public GameSystem {
public:
    /// Pixel distance from a cell center that still counts as aligned for turns.
    static constexpr float kTurnTolerance = static_cast<float>(kTileSize) / 4.0f;

    void Execute(World& world) override;

    [[nodiscard]] std::string_view GetName() const override { return "MovementSystem"; }

    /// True when (pixelX, pixelY) lies within @p tolerance of its cell center.
    [[nodiscard]] static bool IsAligned(float pixelX, float pixelY, float tolerance);
};

} // namespace pacsim::game
