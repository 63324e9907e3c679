#pragma once

/// @file world.hpp
/// @brief Simulation state: the entity registry plus session scalars.

#include "pacsim/game/components.hpp"
#include "pacsim/game/maze.hpp"
#include "pacsim/game/types.hpp"

namespace pacsim::game {

inline constexpr int kDefaultInitialLives = 3;

/// Single-owner mutable context passed to every system.
///
/// Holds the registry, the maze the session plays on and the scalar
/// session state (score, lives, level, timers).  All setters clamp
/// instead of failing.
class World {
public:
    explicit World(const Maze& maze = Maze::Classic(), int initialLives = kDefaultInitialLives);

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // -- Entities -------------------------------------------------------

    [[nodiscard]] Registry& GetRegistry() noexcept { return registry_; }
    [[nodiscard]] const Registry& GetRegistry() const noexcept { return registry_; }

    [[nodiscard]] const Maze& GetMaze() const noexcept { return *maze_; }

    // -- Game state -----------------------------------------------------

    [[nodiscard]] GameState GetState() const noexcept { return state_; }
    void SetState(GameState state) noexcept { state_ = state; }

    // -- Score ----------------------------------------------------------

    [[nodiscard]] int GetScore() const noexcept { return score_; }

    /// Add @p points; non-positive values are ignored.
    void AddScore(int points) noexcept;
    void ResetScore() noexcept { score_ = 0; }

    // -- Lives ----------------------------------------------------------

    [[nodiscard]] int GetLives() const noexcept { return lives_; }
    [[nodiscard]] int GetInitialLives() const noexcept { return initialLives_; }

    /// Remove one life, never going below zero.
    void LoseLife() noexcept;
    void AddLife() noexcept { ++lives_; }
    void ResetLives() noexcept { lives_ = initialLives_; }

    // -- Level ----------------------------------------------------------

    [[nodiscard]] int GetLevel() const noexcept { return level_; }
    void NextLevel() noexcept { ++level_; }
    void ResetLevel() noexcept { level_ = 1; }

    // -- Power-up timer -------------------------------------------------

    [[nodiscard]] float GetPowerUpTime() const noexcept { return powerUpTime_; }
    void SetPowerUpTime(float ms) noexcept;

    /// Decrease the timer by @p deltaMs, clamping at zero.
    void DecreasePowerUpTime(float deltaMs) noexcept;
    [[nodiscard]] bool IsPowerUpActive() const noexcept { return powerUpTime_ > 0.0f; }

    // -- Frame time -----------------------------------------------------

    [[nodiscard]] float GetDeltaTime() const noexcept { return deltaTime_; }
    void SetDeltaTime(float ms) noexcept { deltaTime_ = ms; }

    // -- Ghost kill streak ----------------------------------------------

    [[nodiscard]] int GetGhostEatenStreak() const noexcept { return ghostEatenStreak_; }
    void IncrementGhostEatenStreak() noexcept { ++ghostEatenStreak_; }
    void ResetGhostEatenStreak() noexcept { ghostEatenStreak_ = 0; }

    /// Drop every entity and restore all scalars to their session defaults.
    /// Entity identifiers start again from zero afterwards.
    void Reset();

private:
    const Maze* maze_;
    int initialLives_;

    Registry registry_;
    GameState state_ = GameState::Ready;
    int score_ = 0;
    int lives_;
    int level_ = 1;
    float powerUpTime_ = 0.0f;
    float deltaTime_ = 0.0f;
    int ghostEatenStreak_ = 0;
};

} // namespace pacsim::game
