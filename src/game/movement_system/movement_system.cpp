/// @file movement_system.cpp
/// @brief MovementSystem implementation.

#include "pacsim/game/movement_system.hpp"

#include <algorithm>
#include <cmath>

namespace pacsim::game {

namespace {

constexpr float kTile = static_cast<float>(kTileSize);
constexpr float kHalfTile = kTile / 2.0f;
constexpr float kMazePixelWidth = static_cast<float>(kMazeWidth * kTileSize);

} // namespace

bool MovementSystem::IsAligned(float pixelX, float pixelY, float tolerance) {
    const float centerX = CellCenter(ToGrid(pixelX));
    const float centerY = CellCenter(ToGrid(pixelY));
    return std::abs(pixelX - centerX) <= tolerance && std::abs(pixelY - centerY) <= tolerance;
}

void MovementSystem::Execute(World& world) {
    if (world.GetState() != GameState::Playing) {
        return;
    }
    const float deltaTime = world.GetDeltaTime();
    if (deltaTime == 0.0f) {
        return;
    }

    auto& registry = world.GetRegistry();
    const auto& maze = world.GetMaze();

    registry.MakeQuery<Position, Velocity>().ForEach([&](Entity entity, Position& position,
                                                         Velocity& velocity) {
        if (!velocity.direction && !velocity.nextDirection) {
            return;
        }

        const bool isPlayer = registry.Has<PlayerControlled>(entity);

        float pixelX = position.pixelX;
        float pixelY = position.pixelY;
        auto direction = velocity.direction;
        auto nextDirection = velocity.nextDirection;

        int gridX = ToGrid(pixelX);
        int gridY = ToGrid(pixelY);

        // ── Queued turn ──
        if (nextDirection) {
            if (IsReverse(direction, *nextDirection)) {
                direction = nextDirection;
                nextDirection.reset();
            } else if (IsAligned(pixelX, pixelY, kTurnTolerance)) {
                auto ahead = Step({gridX, gridY}, *nextDirection);
                if (maze.IsWalkable(ahead.x, ahead.y, isPlayer)) {
                    direction = nextDirection;
                    nextDirection.reset();
                    pixelX = CellCenter(gridX);
                    pixelY = CellCenter(gridY);
                }
            }
        }

        // ── Motion ──
        if (direction) {
            const float step = velocity.speed * (deltaTime / kReferenceFrameMs);

            float newX = pixelX;
            float newY = pixelY;
            switch (*direction) {
                case Direction::Up:    newY -= step; break;
                case Direction::Down:  newY += step; break;
                case Direction::Left:  newX -= step; break;
                case Direction::Right: newX += step; break;
            }

            if (gridY == kTunnelRow) {
                if (newX < 0.0f) {
                    newX += kMazePixelWidth;
                } else if (newX >= kMazePixelWidth) {
                    newX -= kMazePixelWidth;
                }
            }

            // Leading edge against the cell it would enter.
            bool canMove = true;
            switch (*direction) {
                case Direction::Right: {
                    const int edgeX = ToGrid(newX + kHalfTile - 1.0f);
                    if (!maze.IsWalkable(edgeX, gridY, isPlayer)) {
                        canMove = false;
                        pixelX = static_cast<float>((gridX + 1) * kTileSize) - kHalfTile;
                    }
                    break;
                }
                case Direction::Left: {
                    const int edgeX = ToGrid(newX - kHalfTile);
                    if (!maze.IsWalkable(edgeX, gridY, isPlayer)) {
                        canMove = false;
                        pixelX = static_cast<float>(gridX * kTileSize) + kHalfTile;
                    }
                    break;
                }
                case Direction::Down: {
                    const int edgeY = ToGrid(newY + kHalfTile - 1.0f);
                    if (!maze.IsWalkable(gridX, edgeY, isPlayer)) {
                        canMove = false;
                        pixelY = static_cast<float>((gridY + 1) * kTileSize) - kHalfTile;
                    }
                    break;
                }
                case Direction::Up: {
                    const int edgeY = ToGrid(newY - kHalfTile);
                    if (!maze.IsWalkable(gridX, edgeY, isPlayer)) {
                        canMove = false;
                        pixelY = static_cast<float>(gridY * kTileSize) + kHalfTile;
                    }
                    break;
                }
            }

            if (canMove) {
                pixelX = newX;
                pixelY = newY;
                gridX = std::clamp(ToGrid(pixelX), 0, kMazeWidth - 1);
                gridY = std::clamp(ToGrid(pixelY), 0, kMazeHeight - 1);
            }
        }

        position = Position{gridX, gridY, pixelX, pixelY};
        velocity.direction = direction;
        velocity.nextDirection = nextDirection;
    });
}

} // namespace pacsim::game
