#pragma once

/// @file types.hpp
/// @brief Grid geometry constants and the game's enumerations.

#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string_view>

namespace pacsim::game {

// ── Geometry ────────────────────────────────────────────────────────────

inline constexpr int kTileSize = 20;
inline constexpr int kMazeWidth = 28;
inline constexpr int kMazeHeight = 31;

/// Row whose outer columns wrap horizontally.
inline constexpr int kTunnelRow = 14;

/// Frame length (ms) that speed values are calibrated against.
inline constexpr float kReferenceFrameMs = 16.67f;

/// Integer cell coordinate.
struct GridPoint {
    int x = 0;
    int y = 0;

    constexpr bool operator==(const GridPoint&) const = default;
};

/// Pixel coordinate of the center of cell @p grid along one axis.
constexpr float CellCenter(int grid) {
    return static_cast<float>(grid * kTileSize) + static_cast<float>(kTileSize) / 2.0f;
}

/// Cell index containing pixel coordinate @p pixel (floor division).
inline int ToGrid(float pixel) {
    return static_cast<int>(std::floor(pixel / static_cast<float>(kTileSize)));
}

// ── Direction ───────────────────────────────────────────────────────────

enum class Direction : uint8_t { Up, Down, Left, Right };

inline constexpr std::array<Direction, 4> kAllDirections = {
    Direction::Up, Direction::Down, Direction::Left, Direction::Right
};

constexpr Direction Opposite(Direction dir) {
    switch (dir) {
        case Direction::Up:    return Direction::Down;
        case Direction::Down:  return Direction::Up;
        case Direction::Left:  return Direction::Right;
        case Direction::Right: return Direction::Left;
    }
    return dir;
}

/// True when @p next is the exact 180° turn of @p current.
constexpr bool IsReverse(std::optional<Direction> current, Direction next) {
    return current.has_value() && Opposite(*current) == next;
}

/// The cell @p tiles steps from @p from along @p dir.
constexpr GridPoint Step(GridPoint from, Direction dir, int tiles = 1) {
    switch (dir) {
        case Direction::Up:    return {from.x, from.y - tiles};
        case Direction::Down:  return {from.x, from.y + tiles};
        case Direction::Left:  return {from.x - tiles, from.y};
        case Direction::Right: return {from.x + tiles, from.y};
    }
    return from;
}

constexpr std::string_view ToString(Direction dir) {
    switch (dir) {
        case Direction::Up:    return "up";
        case Direction::Down:  return "down";
        case Direction::Left:  return "left";
        case Direction::Right: return "right";
    }
    return "unknown";
}

// ── Ghosts ──────────────────────────────────────────────────────────────

/// The four ghost identities.
enum class GhostType : uint8_t {
    Blinky,  ///< Direct chaser
    Pinky,   ///< Ambusher
    Inky,    ///< Flanker
    Clyde    ///< Opportunist
};

inline constexpr std::array<GhostType, 4> kAllGhostTypes = {
    GhostType::Blinky, GhostType::Pinky, GhostType::Inky, GhostType::Clyde
};

enum class GhostMode : uint8_t { Chase, Scatter, Frightened, Eaten };

constexpr std::string_view ToString(GhostType type) {
    switch (type) {
        case GhostType::Blinky: return "blinky";
        case GhostType::Pinky:  return "pinky";
        case GhostType::Inky:   return "inky";
        case GhostType::Clyde:  return "clyde";
    }
    return "unknown";
}

constexpr std::string_view ToString(GhostMode mode) {
    switch (mode) {
        case GhostMode::Chase:      return "chase";
        case GhostMode::Scatter:    return "scatter";
        case GhostMode::Frightened: return "frightened";
        case GhostMode::Eaten:      return "eaten";
    }
    return "unknown";
}

// ── Game state ──────────────────────────────────────────────────────────

enum class GameState : uint8_t { Ready, Playing, Paused, Won, Lost, Dying };

constexpr std::string_view ToString(GameState state) {
    switch (state) {
        case GameState::Ready:   return "ready";
        case GameState::Playing: return "playing";
        case GameState::Paused:  return "paused";
        case GameState::Won:     return "won";
        case GameState::Lost:    return "lost";
        case GameState::Dying:   return "dying";
    }
    return "unknown";
}

// ── Maze cells ──────────────────────────────────────────────────────────

enum class CellType : uint8_t { Wall, Path, Tunnel, GhostHouse, GhostDoor };

}  // namespace pacsim::game
