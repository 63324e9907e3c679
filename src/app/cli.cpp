/// @file cli.cpp
/// @brief Argument parsing and configuration loading.

#include "pacsim/app/cli.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string_view>

namespace pacsim::app {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameError invalid(const std::string& message) {
    return GameError(ErrorCode::InvalidArgument, message);
}

template <typename T>
std::optional<T> parseNumber(std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

GameResult<std::vector<game::Direction>> parseScript(const std::string& script) {
    std::vector<game::Direction> directions;
    directions.reserve(script.size());
    for (char c : script) {
        switch (std::toupper(static_cast<unsigned char>(c))) {
            case 'U': directions.push_back(game::Direction::Up); break;
            case 'D': directions.push_back(game::Direction::Down); break;
            case 'L': directions.push_back(game::Direction::Left); break;
            case 'R': directions.push_back(game::Direction::Right); break;
            default:
                return GameResult<std::vector<game::Direction>>::err(
                    invalid(std::string("unknown script direction '") + c + "'"));
        }
    }
    return GameResult<std::vector<game::Direction>>::ok(std::move(directions));
}

GameResult<RunOptions> parseArgs(int argc, const char* const argv[]) {
    RunOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        if (arg == "--realtime") {
            options.realtime = true;
            continue;
        }

        if (i + 1 >= argc) {
            return GameResult<RunOptions>::err(invalid("missing value for " + std::string(arg)));
        }
        const std::string_view value(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        if (arg == "--config") {
            options.configPath = std::filesystem::path(std::string(value));
        } else if (arg == "--frames") {
            auto frames = parseNumber<uint64_t>(value);
            if (!frames) {
                return GameResult<RunOptions>::err(invalid("--frames expects a count"));
            }
            options.frames = *frames;
        } else if (arg == "--tick-rate") {
            auto rate = parseNumber<uint32_t>(value);
            if (!rate || *rate == 0) {
                return GameResult<RunOptions>::err(invalid("--tick-rate expects a positive count"));
            }
            options.tickRate = *rate;
        } else if (arg == "--script") {
            auto script = parseScript(std::string(value));
            if (!script) {
                return GameResult<RunOptions>::err(script.error());
            }
            options.script = script.value();
        } else {
            return GameResult<RunOptions>::err(invalid("unknown option " + std::string(arg)));
        }
    }

    return GameResult<RunOptions>::ok(std::move(options));
}

GameResult<void> loadConfig(foundation::ConfigManager& config,
                            const std::filesystem::path& path) {
    std::filesystem::path configPath = path;

    // Environment variable override.
    const char* envPath = std::getenv("PACSIM_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    if (configPath.empty()) {
        return GameResult<void>::ok();
    }
    return config.load(configPath);
}

} // namespace pacsim::app
