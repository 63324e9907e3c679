/// @file world.cpp
/// @brief World scalar state and reset.

#include "pacsim/game/world.hpp"

#include <algorithm>

namespace pacsim::game {

World::World(const Maze& maze, int initialLives)
    : maze_(&maze), initialLives_(std::max(0, initialLives)), lives_(initialLives_) {}

void World::AddScore(int points) noexcept {
    if (points <= 0) {
        return;
    }
    score_ += points;
}

void World::LoseLife() noexcept {
    lives_ = std::max(0, lives_ - 1);
}

void World::SetPowerUpTime(float ms) noexcept {
    powerUpTime_ = std::max(0.0f, ms);
}

void World::DecreasePowerUpTime(float deltaMs) noexcept {
    powerUpTime_ = std::max(0.0f, powerUpTime_ - deltaMs);
}

void World::Reset() {
    // A fresh registry restarts entity numbering; Clear() would not.
    registry_ = Registry{};
    state_ = GameState::Ready;
    score_ = 0;
    lives_ = initialLives_;
    level_ = 1;
    powerUpTime_ = 0.0f;
    deltaTime_ = 0.0f;
    ghostEatenStreak_ = 0;
}

} // namespace pacsim::game
