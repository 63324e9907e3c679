#pragma once

/// @file power_up_system.hpp
/// @brief PowerUpSystem: power-up countdown and ghost vulnerability.

#include <string_view>

#include "pacsim/foundation/event_bus.hpp"
#include "pacsim/game/game_config.hpp"
#include "pacsim/game/game_system.hpp"

namespace pacsim::game {

/// Runs the World power-up timer and mirrors it onto ghost Vulnerable
/// components.
///
/// When the timer turns on, every ghost without Vulnerable receives one.
/// While it runs, the timer drops by dt and every Vulnerable is kept in
/// step, flashing once the time left is at most the warning threshold
/// (PowerUpWarning is published once per activation).  When it reaches
/// zero Vulnerable is stripped, the streak reset and PowerUpEnded sent.
class PowerUpSystem final : public GameSystem {
public:
    explicit PowerUpSystem(foundation::EventBus& bus, const GameConfig& config = GameConfig{});

    void Execute(World& world) override;

    [[nodiscard]] std::string_view GetName() const override { return "PowerUpSystem"; }

    /// Forget the previous tick's activation state.
    void Reset() noexcept;

private:
    foundation::EventBus& bus_;
    float warningThreshold_;

    bool wasActive_ = false;
    bool warningDispatched_ = false;
};

} // namespace pacsim::game
