#pragma once

/// @file cli.hpp
/// @brief Command-line options and configuration loading for the pacsim executable.

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "pacsim/foundation/config_manager.hpp"
#include "pacsim/foundation/game_result.hpp"
#include "pacsim/game/types.hpp"

namespace pacsim::app {

/// Options of one headless run.
struct RunOptions {
    /// YAML file to load; empty runs on defaults.
    std::filesystem::path configPath;

    /// Ticks to simulate before stopping (the game may end sooner).
    uint64_t frames = 3600;

    /// Directions applied one per simulated second.
    std::vector<game::Direction> script;

    /// Tick at wall-clock rate on the loop thread instead of as fast as possible.
    bool realtime = false;

    uint32_t tickRate = 60;
};

/// Parse `--config <yaml>`, `--frames N`, `--script UDLR`, `--tick-rate N`
/// and `--realtime`.
/// @return InvalidArgument for unknown flags, missing values, non-numeric
///         counts or script letters other than U, D, L, R.
[[nodiscard]] foundation::GameResult<RunOptions> parseArgs(int argc, const char* const argv[]);

/// Decode a U/D/L/R script (case-insensitive).
[[nodiscard]] foundation::GameResult<std::vector<game::Direction>> parseScript(
    const std::string& script);

/// Load @p config from @p path, or from PACSIM_CONFIG_PATH when set.
///
/// With neither available the manager is left empty and defaults apply.
foundation::GameResult<void> loadConfig(foundation::ConfigManager& config,
                                        const std::filesystem::path& path);

} // namespace pacsim::app
