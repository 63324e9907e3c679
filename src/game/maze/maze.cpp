/// @file maze.cpp
/// @brief Maze layout parsing and the classic arcade layout.

#include "pacsim/game/maze.hpp"

#include <string>

namespace pacsim::game {

namespace {

// clang-format off
constexpr std::array<std::string_view, kMazeHeight> kClassicLayout = {
    "1111111111111111111111111111",
    "1000000000000110000000000001",
    "1011110111110110111110111101",
    "1311110111110110111110111131",
    "1011110111110110111110111101",
    "1000000000000000000000000001",
    "1011110110111111110110111101",
    "1011110110111111110110111101",
    "1000000110000110000110000001",
    "1111110111110110111110111111",
    "1111110111110110111110111111",
    "1111110110000000000110111111",
    "1111110110111551110110111111",
    "1111110110122222210110111111",
    "4444440000122222210000444444",
    "1111110110122222210110111111",
    "1111110110111111110110111111",
    "1111110110000000000110111111",
    "1111110110111111110110111111",
    "1000000000000110000000000001",
    "1011110111110110111110111101",
    "1011110111110110111110111101",
    "1300110000000440000000110031",
    "1110110110111111110110110111",
    "1110110110111111110110110111",
    "1000000110000110000110000001",
    "1011111111110110111111111101",
    "1011111111110110111111111101",
    "1000000000000000000000000001",
    "1111111111111111111111111111",
    "1111111111111111111111111111",
};
// clang-format on

bool isKnownCode(char c) {
    return c >= '0' && c <= '5';
}

CellType decode(char code, int y) {
    switch (code) {
        case '1': return CellType::Wall;
        case '2': return CellType::GhostHouse;
        case '5': return CellType::GhostDoor;
        case '4': return y == kTunnelRow ? CellType::Tunnel : CellType::Path;
        default:  return CellType::Path;
    }
}

} // namespace

Maze::Maze(const std::vector<std::string_view>& rows) {
    for (int y = 0; y < kMazeHeight; ++y) {
        for (int x = 0; x < kMazeWidth; ++x) {
            const char code = rows[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)];
            cells_[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)] = decode(code, y);
            if (code == '0') {
                pellets_.push_back({x, y});
            } else if (code == '3') {
                powerPellets_.push_back({x, y});
            }
        }
    }
}

foundation::GameResult<Maze> Maze::FromLayout(const std::vector<std::string_view>& rows) {
    using foundation::ErrorCode;
    using foundation::GameError;

    if (rows.size() != static_cast<std::size_t>(kMazeHeight)) {
        return foundation::GameResult<Maze>::err(GameError(
            ErrorCode::InvalidArgument,
            "maze layout needs " + std::to_string(kMazeHeight) + " rows, got " +
                std::to_string(rows.size())));
    }
    for (std::size_t y = 0; y < rows.size(); ++y) {
        if (rows[y].size() != static_cast<std::size_t>(kMazeWidth)) {
            return foundation::GameResult<Maze>::err(GameError(
                ErrorCode::InvalidArgument,
                "maze row " + std::to_string(y) + " has width " + std::to_string(rows[y].size())));
        }
        for (char c : rows[y]) {
            if (!isKnownCode(c)) {
                return foundation::GameResult<Maze>::err(GameError(
                    ErrorCode::InvalidArgument,
                    "unknown cell code '" + std::string(1, c) + "' in row " + std::to_string(y)));
            }
        }
    }
    return foundation::GameResult<Maze>::ok(Maze(rows));
}

const Maze& Maze::Classic() {
    static const Maze classic(
        std::vector<std::string_view>(kClassicLayout.begin(), kClassicLayout.end()));
    return classic;
}

std::optional<CellType> Maze::CellAt(int x, int y) const {
    if (!InBounds(x, y)) {
        return std::nullopt;
    }
    return cells_[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)];
}

bool Maze::IsWalkable(int x, int y, bool isPlayer) const {
    if (y < 0 || y >= kMazeHeight) {
        return false;
    }
    if (x < 0 || x >= kMazeWidth) {
        return y == kTunnelRow;
    }

    const auto cell = cells_[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)];
    if (cell == CellType::Wall) {
        return false;
    }
    if (isPlayer && (cell == CellType::GhostHouse || cell == CellType::GhostDoor)) {
        return false;
    }
    return true;
}

bool Maze::IsGhostWalkable(int x, int y) const {
    auto cell = CellAt(x, y);
    return cell.has_value() && *cell != CellType::Wall;
}

GridPoint Maze::GhostStart(GhostType type) const noexcept {
    switch (type) {
        case GhostType::Blinky: return {14, 11};
        case GhostType::Pinky:  return {14, 14};
        case GhostType::Inky:   return {12, 14};
        case GhostType::Clyde:  return {16, 14};
    }
    return kGhostHouseTarget;
}

GridPoint Maze::ScatterCorner(GhostType type) const noexcept {
    switch (type) {
        case GhostType::Blinky: return {25, 0};
        case GhostType::Pinky:  return {2, 0};
        case GhostType::Inky:   return {27, 30};
        case GhostType::Clyde:  return {0, 30};
    }
    return {0, 0};
}

} // namespace pacsim::game
