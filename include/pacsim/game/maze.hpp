#pragma once

/// @file maze.hpp
/// @brief Immutable maze layout with walkability rules and spawn data.

#include <array>
#include <optional>
#include <string_view>
#include <vector>

#include "pacsim/foundation/game_result.hpp"
#include "pacsim/game/types.hpp"

namespace pacsim::game {

/// Static description of one maze.
///
/// Layouts are rows of single-digit cell codes:
///   0 path with pellet, 1 wall, 2 ghost house, 3 path with power pellet,
///   4 empty path (tunnel on the tunnel row), 5 ghost-house door.
///
/// The maze is read-only once built; Classic() returns the shared
/// arcade layout used by the simulation.
class Maze {
public:
    /// Build a maze from layout rows, validating dimensions and codes.
    /// @return InvalidArgument if a row has the wrong width, the row count
    ///         is not kMazeHeight or a character is not a known code.
    static foundation::GameResult<Maze> FromLayout(const std::vector<std::string_view>& rows);

    /// The classic 28x31 arcade maze.
    static const Maze& Classic();

    // -- Cells ----------------------------------------------------------

    /// Cell type at (x, y), or nullopt outside the grid.
    [[nodiscard]] std::optional<CellType> CellAt(int x, int y) const;

    [[nodiscard]] bool InBounds(int x, int y) const noexcept {
        return x >= 0 && x < kMazeWidth && y >= 0 && y < kMazeHeight;
    }

    /// Movement walkability.
    ///
    /// Walls block everyone.  The player is also kept out of the ghost
    /// house and its door.  Columns outside the grid are open only on
    /// the tunnel row so entities can wrap around.
    [[nodiscard]] bool IsWalkable(int x, int y, bool isPlayer) const;

    /// Walkability used by ghost path planning: inside the grid and not a wall.
    [[nodiscard]] bool IsGhostWalkable(int x, int y) const;

    // -- Spawn data -----------------------------------------------------

    [[nodiscard]] const std::vector<GridPoint>& Pellets() const noexcept { return pellets_; }
    [[nodiscard]] const std::vector<GridPoint>& PowerPellets() const noexcept {
        return powerPellets_;
    }

    [[nodiscard]] GridPoint PlayerStart() const noexcept { return kPlayerStart; }
    [[nodiscard]] GridPoint GhostStart(GhostType type) const noexcept;
    [[nodiscard]] GridPoint ScatterCorner(GhostType type) const noexcept;

    /// Cell eaten ghosts head for before resuming normal behavior.
    [[nodiscard]] GridPoint GhostHouseTarget() const noexcept { return kGhostHouseTarget; }

    static constexpr GridPoint kPlayerStart{14, 22};
    static constexpr GridPoint kGhostHouseTarget{13, 14};

private:
    explicit Maze(const std::vector<std::string_view>& rows);

    std::array<std::array<CellType, kMazeWidth>, kMazeHeight> cells_{};
    std::vector<GridPoint> pellets_;
    std::vector<GridPoint> powerPellets_;
};

} // namespace pacsim::game
