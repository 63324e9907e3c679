/// @file main.cpp
/// @brief Headless pacsim entry point.
///
/// Runs one session of the simulation, optionally steering the player
/// with a direction script, and prints the outcome.

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "pacsim/app/cli.hpp"
#include "pacsim/app/game_loop.hpp"
#include "pacsim/foundation/config_manager.hpp"
#include "pacsim/foundation/game_logger.hpp"
#include "pacsim/game/events.hpp"
#include "pacsim/game/game_config.hpp"
#include "pacsim/game/game_controller.hpp"
#include "pacsim/game/selectors.hpp"
#include "pacsim/version.hpp"

namespace {

using pacsim::foundation::LogCategory;

void logEvents(pacsim::foundation::EventBus& bus) {
    using namespace pacsim::game;

    bus.Subscribe<PowerPelletEaten>([](const PowerPelletEaten& e) {
        PACSIM_LOG_INFO(LogCategory::Gameplay,
                        std::string(PowerPelletEaten::kName) + " +" + std::to_string(e.points));
    });
    bus.Subscribe<GhostEaten>([](const GhostEaten& e) {
        PACSIM_LOG_INFO(LogCategory::Gameplay, std::string(GhostEaten::kName) + " " +
                                                   std::string(ToString(e.ghostType)) + " +" +
                                                   std::to_string(e.points));
    });
    bus.Subscribe<PlayerDied>([](const PlayerDied& e) {
        PACSIM_LOG_INFO(LogCategory::Gameplay, std::string(PlayerDied::kName) + " lives=" +
                                                   std::to_string(e.livesRemaining));
    });
    bus.Subscribe<LevelComplete>([](const LevelComplete& e) {
        PACSIM_LOG_INFO(LogCategory::Gameplay, std::string(LevelComplete::kName) + " score=" +
                                                   std::to_string(e.score));
    });
    bus.Subscribe<GameOver>([](const GameOver& e) {
        PACSIM_LOG_INFO(LogCategory::Gameplay,
                        std::string(GameOver::kName) + " score=" + std::to_string(e.finalScore));
    });
}

bool isFinished(const pacsim::game::World& world) {
    return pacsim::game::IsGameOver(world) || pacsim::game::IsGameWon(world);
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = pacsim::app::parseArgs(argc, argv);
    if (!options) {
        std::cerr << "pacsim " << pacsim::Version::string << ": "
                  << options.error().message() << "\n"
                  << "usage: pacsim [--config file.yaml] [--frames N] [--script UDLR]"
                     " [--tick-rate N] [--realtime]\n";
        return EXIT_FAILURE;
    }
    const auto& opts = options.value();

    pacsim::foundation::ConfigManager config;
    auto loadResult = pacsim::app::loadConfig(config, opts.configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    pacsim::game::GameController controller(pacsim::game::LoadGameConfig(config));
    logEvents(controller.GetEventBus());
    controller.Init();
    controller.Start();

    pacsim::app::GameLoop loop(opts.tickRate);
    std::size_t nextStep = 0;
    loop.setTickCallback([&](float deltaMs) {
        const auto tick = loop.tickCount();
        if (nextStep < opts.script.size() && tick % opts.tickRate == 0) {
            controller.GetEventBus().Publish(
                pacsim::game::InputDirection{opts.script[nextStep++]});
        }
        controller.Update(deltaMs);
        if (tick + 1 >= opts.frames || isFinished(controller.GetWorld())) {
            loop.requestStop();
        }
    });

    if (opts.realtime) {
        if (!loop.start()) {
            std::cerr << "Failed to start game loop\n";
            return EXIT_FAILURE;
        }
        while (loop.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        loop.stop();
    } else {
        while (loop.tickCount() < opts.frames && !isFinished(controller.GetWorld())) {
            loop.tick();
        }
    }

    const auto& world = controller.GetWorld();
    std::cout << "ticks: " << loop.tickCount() << "\n"
              << "score: " << world.GetScore() << "\n"
              << "lives: " << world.GetLives() << "\n"
              << "level: " << world.GetLevel() << "\n"
              << "state: " << pacsim::game::ToString(world.GetState()) << "\n";

    controller.Destroy();

    if (auto flushed = pacsim::foundation::GameLogger::instance().flush(); !flushed) {
        std::cerr << "Failed to flush logger: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
