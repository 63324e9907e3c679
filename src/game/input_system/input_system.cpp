/// @file input_system.cpp
/// @brief InputSystem implementation.

#include "pacsim/game/input_system.hpp"

#include <string>

#include "pacsim/foundation/game_logger.hpp"
#include "pacsim/game/events.hpp"
#include "pacsim/game/selectors.hpp"

namespace pacsim::game {

using foundation::LogCategory;

InputSystem::InputSystem(foundation::EventBus& bus) : bus_(bus) {
    subscriptions_.push_back(bus_.Subscribe<InputDirection>(
        [this](const InputDirection& e) { pendingDirection_ = e.direction; }));
    subscriptions_.push_back(
        bus_.Subscribe<InputStart>([this](const InputStart&) { startRequested_ = true; }));
    subscriptions_.push_back(
        bus_.Subscribe<InputPause>([this](const InputPause&) { pauseRequested_ = true; }));
    subscriptions_.push_back(
        bus_.Subscribe<InputRestart>([this](const InputRestart&) { restartRequested_ = true; }));
}

InputSystem::~InputSystem() {
    for (auto id : subscriptions_) {
        bus_.Unsubscribe(id);
    }
}

void InputSystem::clearLatches() noexcept {
    pendingDirection_.reset();
    startRequested_ = false;
    pauseRequested_ = false;
    restartRequested_ = false;
}

void InputSystem::Execute(World& world) {
    if (restartRequested_) {
        clearLatches();
        PACSIM_LOG_INFO(LogCategory::Input, "restart requested");
        bus_.Publish(GameRestart{});
        return;
    }

    if (startRequested_) {
        startRequested_ = false;
        if (world.GetState() == GameState::Ready) {
            world.SetState(GameState::Playing);
            PACSIM_LOG_INFO(LogCategory::Input, "start: ready -> playing");
        }
    }

    if (pauseRequested_) {
        pauseRequested_ = false;
        if (world.GetState() == GameState::Playing) {
            world.SetState(GameState::Paused);
            PACSIM_LOG_INFO(LogCategory::Input, "paused");
        } else if (world.GetState() == GameState::Paused) {
            world.SetState(GameState::Playing);
            PACSIM_LOG_INFO(LogCategory::Input, "unpaused");
        }
    }

    if (pendingDirection_) {
        auto direction = *pendingDirection_;
        pendingDirection_.reset();

        auto player = GetPlayerEntity(world);
        if (!player) {
            return;
        }
        if (auto* velocity = world.GetRegistry().Get<Velocity>(*player)) {
            velocity->nextDirection = direction;
            PACSIM_LOG_TRACE(LogCategory::Input,
                             "queued direction " + std::string(ToString(direction)));
        }
    }
}

} // namespace pacsim::game
