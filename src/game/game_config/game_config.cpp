/// @file game_config.cpp
/// @brief GameConfig defaults and YAML overlay.

#include "pacsim/game/game_config.hpp"

#include <string>

#include "pacsim/foundation/game_logger.hpp"
#include "pacsim/game/types.hpp"

namespace pacsim::game {

namespace {

using foundation::ErrorCode;
using foundation::LogCategory;

template <typename T>
void overlay(const foundation::ConfigManager& config, std::string_view key, T& target) {
    auto value = config.get<T>(key);
    if (value.hasValue()) {
        target = value.value();
        return;
    }
    if (value.error().code() != ErrorCode::ConfigKeyNotFound) {
        PACSIM_LOG_WARN(LogCategory::Config,
                        std::string(value.error().message()) + ", keeping default");
    }
}

} // namespace

float GameConfig::ContactDistance() const noexcept {
    return static_cast<float>(kTileSize) * contactFactor;
}

GameConfig LoadGameConfig(const foundation::ConfigManager& config) {
    GameConfig result;

    overlay(config, "game.initial_lives", result.initialLives);
    overlay(config, "game.speed.player", result.playerSpeed);
    overlay(config, "game.speed.ghost", result.ghostSpeed);
    overlay(config, "game.speed.frightened", result.frightenedSpeed);

    overlay(config, "timing.power_ms", result.powerUpDuration);
    overlay(config, "timing.power_warning_ms", result.powerUpWarning);
    overlay(config, "timing.scatter_ms", result.scatterDuration);
    overlay(config, "timing.chase_ms", result.chaseDuration);
    overlay(config, "timing.respawn_ms", result.respawnDelay);
    overlay(config, "timing.ghost_respawn_ms", result.ghostRespawnDelay);

    overlay(config, "score.pellet", result.pelletPoints);
    overlay(config, "score.power_pellet", result.powerPelletPoints);

    overlay(config, "rules.contact_factor", result.contactFactor);

    overlay(config, "ai.clyde_threshold", result.clydeThreshold);
    overlay(config, "ai.pinky_lookahead", result.pinkyLookAhead);
    overlay(config, "ai.inky_lookahead", result.inkyLookAhead);
    overlay(config, "ai.random_seed", result.randomSeed);

    PACSIM_LOG_DEBUG(LogCategory::Config,
                     "game config loaded: lives=" + std::to_string(result.initialLives) +
                         " power_ms=" + std::to_string(result.powerUpDuration));
    return result;
}

} // namespace pacsim::game
