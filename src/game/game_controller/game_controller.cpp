/// @file game_controller.cpp
/// @brief GameController implementation.

#include "pacsim/game/game_controller.hpp"

#include <string>

#include "pacsim/foundation/game_logger.hpp"
#include "pacsim/game/collision_system.hpp"
#include "pacsim/game/eating_system.hpp"
#include "pacsim/game/entity_factory.hpp"
#include "pacsim/game/events.hpp"
#include "pacsim/game/ghost_ai_system.hpp"
#include "pacsim/game/input_system.hpp"
#include "pacsim/game/movement_system.hpp"
#include "pacsim/game/power_up_system.hpp"
#include "pacsim/game/selectors.hpp"

namespace pacsim::game {

using foundation::LogCategory;

GameController::GameController(const GameConfig& config, const Maze& maze)
    : config_(config), world_(maze, config.initialLives) {
    registerSystems();

    subscriptions_.push_back(
        bus_.Subscribe<GameRestart>([this](const GameRestart&) { needsReinit_ = true; }));
    subscriptions_.push_back(bus_.Subscribe<PlayerDied>([this](const PlayerDied& e) {
        if (e.livesRemaining > 0) {
            world_.SetState(GameState::Dying);
            respawnTimer_ = config_.respawnDelay;
        }
    }));
}

GameController::~GameController() {
    for (auto id : subscriptions_) {
        bus_.Unsubscribe(id);
    }
}

void GameController::registerSystems() {
    scheduler_.Register<InputSystem>(bus_);
    scheduler_.Register<GhostAISystem>(bus_, config_);
    scheduler_.Register<MovementSystem>();
    scheduler_.Register<EatingSystem>(bus_, config_);
    scheduler_.Register<PowerUpSystem>(bus_, config_);
    scheduler_.Register<CollisionSystem>(bus_, config_);

    scheduler_.AddDependency<GhostAISystem, MovementSystem>();
    scheduler_.AddDependency<MovementSystem, EatingSystem>();
    scheduler_.AddDependency<EatingSystem, PowerUpSystem>();

    if (auto built = scheduler_.Build(); !built) {
        PACSIM_LOG_ERROR(LogCategory::Core,
                         "system pipeline build failed: " + std::string(built.error().message()));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

void GameController::Init() {
    world_.Reset();
    modeTimer_ = 0.0f;
    scatterPhase_ = true;
    respawnTimer_ = 0.0f;
    resetSystems();
    if (config_.randomSeed != 0) {
        GetGhostAI().Seed(config_.randomSeed);
    }

    PopulateWorld(world_, config_);
    world_.SetState(GameState::Ready);

    PACSIM_LOG_INFO(LogCategory::Core,
                    "session initialised with " +
                        std::to_string(GetRemainingPelletCount(world_)) + " edibles");
}

void GameController::Update(float deltaMs) {
    if (needsReinit_) {
        needsReinit_ = false;
        PACSIM_LOG_INFO(LogCategory::Core, "restarting session");
        Init();
        return;
    }

    world_.SetDeltaTime(deltaMs);

    if (world_.GetState() == GameState::Dying) {
        respawnTimer_ -= deltaMs;
        if (respawnTimer_ <= 0.0f) {
            respawnTimer_ = 0.0f;
            resetPositions();
            world_.SetState(GameState::Playing);
            PACSIM_LOG_INFO(LogCategory::Core, "player respawned");
            bus_.Publish(PlayerRespawned{});
        }
        return;
    }

    if (world_.GetState() == GameState::Playing && !world_.IsPowerUpActive()) {
        advanceModeTimer(deltaMs);
    }

    scheduler_.Execute(world_);
}

void GameController::Start() {
    if (world_.GetState() != GameState::Ready) {
        return;
    }
    world_.SetState(GameState::Playing);
    PACSIM_LOG_INFO(LogCategory::Core, "game started");
    bus_.Publish(GameStarted{});
}

void GameController::Pause() {
    if (world_.GetState() != GameState::Playing) {
        return;
    }
    world_.SetState(GameState::Paused);
    PACSIM_LOG_INFO(LogCategory::Core, "game paused");
    bus_.Publish(GamePaused{});
}

void GameController::Resume() {
    if (world_.GetState() != GameState::Paused) {
        return;
    }
    world_.SetState(GameState::Playing);
    PACSIM_LOG_INFO(LogCategory::Core, "game resumed");
    bus_.Publish(GameResumed{});
}

void GameController::Destroy() {
    bus_.Clear();
    subscriptions_.clear();
}

// ═══════════════════════════════════════════════════════════════════════════
// Internals
// ═══════════════════════════════════════════════════════════════════════════

void GameController::advanceModeTimer(float deltaMs) {
    modeTimer_ += deltaMs;
    const float phaseLength = scatterPhase_ ? config_.scatterDuration : config_.chaseDuration;
    if (modeTimer_ < phaseLength) {
        return;
    }

    modeTimer_ = 0.0f;
    scatterPhase_ = !scatterPhase_;
    const GhostMode mode = scatterPhase_ ? GhostMode::Scatter : GhostMode::Chase;
    PACSIM_LOG_DEBUG(LogCategory::AI, "ghost phase -> " + std::string(ToString(mode)));
    bus_.Publish(GhostModeChanged{mode});
}

void GameController::resetPositions() {
    auto& registry = world_.GetRegistry();
    const auto& maze = world_.GetMaze();

    if (auto player = GetPlayerEntity(world_)) {
        const GridPoint start = maze.PlayerStart();
        registry.Add(*player, Position::AtCell(start.x, start.y));
        registry.Add(*player, Velocity{std::nullopt, config_.playerSpeed, std::nullopt});
    }

    for (Entity ghost : GetGhostEntities(world_)) {
        auto* ai = registry.Get<GhostAI>(ghost);
        if (ai == nullptr) {
            continue;
        }
        GridPoint start = maze.GhostStart(ai->type);
        if (const auto* spawn = registry.Get<Respawnable>(ghost)) {
            start = GridPoint{spawn->spawnX, spawn->spawnY};
        }
        ai->mode = GhostMode::Scatter;
        registry.Add(ghost, Position::AtCell(start.x, start.y));
        registry.Add(ghost, Velocity{std::nullopt, config_.ghostSpeed, std::nullopt});
        registry.Remove<Vulnerable>(ghost);
    }

    world_.SetPowerUpTime(0.0f);
    world_.ResetGhostEatenStreak();
    modeTimer_ = 0.0f;
    scatterPhase_ = true;
    resetSystems();
}

void GameController::resetSystems() {
    GetGhostAI().Reset();
    if (auto* powerUp = scheduler_.GetSystem<PowerUpSystem>()) {
        powerUp->Reset();
    }
}

GhostAISystem& GameController::GetGhostAI() {
    return *scheduler_.GetSystem<GhostAISystem>();
}

} // namespace pacsim::game
