#pragma once

/// @file events.hpp
/// @brief Event catalog exchanged over the EventBus.
///
/// Every event carries a stable wire-style name in @c kName for logging
/// and for front-ends that key events by string.

#include <string_view>

#include "pacsim/ecs/entity.hpp"
#include "pacsim/game/types.hpp"

namespace pacsim::game {

// ── Input (front-end → simulation) ──────────────────────────────────────

struct InputDirection {
    static constexpr std::string_view kName = "input:direction";
    Direction direction = Direction::Left;
};

struct InputPause {
    static constexpr std::string_view kName = "input:pause";
};

struct InputStart {
    static constexpr std::string_view kName = "input:start";
};

struct InputRestart {
    static constexpr std::string_view kName = "input:restart";
};

// ── Lifecycle ───────────────────────────────────────────────────────────

struct GameStarted {
    static constexpr std::string_view kName = "game:started";
};

struct GamePaused {
    static constexpr std::string_view kName = "game:paused";
};

struct GameResumed {
    static constexpr std::string_view kName = "game:resumed";
};

struct GameOver {
    static constexpr std::string_view kName = "game:over";
    int finalScore = 0;
    int level = 1;
};

/// Requests a full re-initialisation on the controller's next update.
struct GameRestart {
    static constexpr std::string_view kName = "game:restart";
};

struct LevelComplete {
    static constexpr std::string_view kName = "level:complete";
    int level = 1;
    int score = 0;
};

// ── Gameplay ────────────────────────────────────────────────────────────

struct PelletEaten {
    static constexpr std::string_view kName = "pellet:eaten";
    ecs::Entity entity;
    GridPoint position;
    int points = 0;
};

struct PowerPelletEaten {
    static constexpr std::string_view kName = "power:eaten";
    ecs::Entity entity;
    GridPoint position;
    int points = 0;
    float duration = 0.0f;
};

struct GhostEaten {
    static constexpr std::string_view kName = "ghost:eaten";
    ecs::Entity ghost;
    GhostType ghostType = GhostType::Blinky;
    int points = 0;
    int streak = 0;
    GridPoint position;
};

struct PlayerDied {
    static constexpr std::string_view kName = "player:died";
    int livesRemaining = 0;
};

struct PlayerRespawned {
    static constexpr std::string_view kName = "player:respawned";
};

// ── Power-up and ghost mode ─────────────────────────────────────────────

struct PowerUpStarted {
    static constexpr std::string_view kName = "powerup:started";
    float timeRemaining = 0.0f;
};

struct PowerUpWarning {
    static constexpr std::string_view kName = "powerup:warning";
    float timeRemaining = 0.0f;
};

struct PowerUpEnded {
    static constexpr std::string_view kName = "powerup:ended";
};

/// Global scatter/chase flip.  @c mode is always Scatter or Chase.
struct GhostModeChanged {
    static constexpr std::string_view kName = "ghost:mode";
    GhostMode mode = GhostMode::Scatter;
};

} // namespace pacsim::game
