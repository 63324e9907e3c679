#pragma once

/// @file game_config.hpp
/// @brief Tunable gameplay constants and their YAML binding.

#include <cstdint>

#include "pacsim/foundation/config_manager.hpp"
#include "pacsim/game/types.hpp"

namespace pacsim::game {

/// Gameplay tunables.  Defaults reproduce the classic arcade feel.
///
/// Times are milliseconds, speeds are pixels per 16.67 ms frame.
struct GameConfig {
    int initialLives = 3;

    float playerSpeed = 2.0f;
    float ghostSpeed = 1.5f;
    float frightenedSpeed = 1.0f;

    float powerUpDuration = 6000.0f;
    float powerUpWarning = 2000.0f;
    float scatterDuration = 7000.0f;
    float chaseDuration = 20000.0f;
    float respawnDelay = 1500.0f;
    float ghostRespawnDelay = 3000.0f;

    int pelletPoints = 10;
    int powerPelletPoints = 50;

    /// Contact distance as a fraction of kTileSize.
    float contactFactor = 0.8f;

    /// Clyde chases only while farther than this many tiles.
    float clydeThreshold = 8.0f;
    int pinkyLookAhead = 4;
    int inkyLookAhead = 2;

    /// Seed for frightened-mode direction choice.  0 seeds from the device.
    uint32_t randomSeed = 0;

    [[nodiscard]] float ContactDistance() const noexcept;
};

/// Overlay the keys present in @p config on the defaults.
///
/// Recognised keys:
///   game.initial_lives, game.speed.player, game.speed.ghost,
///   game.speed.frightened, timing.power_ms, timing.power_warning_ms,
///   timing.scatter_ms, timing.chase_ms, timing.respawn_ms,
///   timing.ghost_respawn_ms, score.pellet, score.power_pellet,
///   rules.contact_factor, ai.clyde_threshold, ai.pinky_lookahead,
///   ai.inky_lookahead, ai.random_seed
///
/// A key with the wrong type is logged at Warning and its default kept.
[[nodiscard]] GameConfig LoadGameConfig(const foundation::ConfigManager& config);

} // namespace pacsim::game
