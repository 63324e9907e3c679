#pragma once

/// @file input_system.hpp
/// @brief InputSystem: applies latched player intents once per tick.

#include <optional>
#include <string_view>
#include <vector>

#include "pacsim/foundation/event_bus.hpp"
#include "pacsim/game/game_system.hpp"

namespace pacsim::game {

/// Latches input events between ticks and applies them in Execute().
///
/// Per tick, in order:
///   1. A restart intent clears every other latch, publishes GameRestart
///      and ends the tick for this system.
///   2. A start intent moves Ready to Playing.
///   3. A pause intent toggles Playing and Paused.
///   4. A direction intent is queued on the player's Velocity.
class InputSystem final : public GameSystem {
public:
    explicit InputSystem(foundation::EventBus& bus);
    ~InputSystem() override;

    InputSystem(const InputSystem&) = delete;
    InputSystem& operator=(const InputSystem&) = delete;

    void Execute(World& world) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::PreUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "InputSystem"; }

private:
    void clearLatches() noexcept;

    foundation::EventBus& bus_;
    std::vector<foundation::SubscriptionId> subscriptions_;

    std::optional<Direction> pendingDirection_;
    bool startRequested_ = false;
    bool pauseRequested_ = false;
    bool restartRequested_ = false;
};

} // namespace pacsim::game
