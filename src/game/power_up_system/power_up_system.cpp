/// @file power_up_system.cpp
/// @brief PowerUpSystem implementation.

#include "pacsim/game/power_up_system.hpp"

#include "pacsim/foundation/game_logger.hpp"
#include "pacsim/game/events.hpp"
#include "pacsim/game/selectors.hpp"

namespace pacsim::game {

using foundation::LogCategory;

PowerUpSystem::PowerUpSystem(foundation::EventBus& bus, const GameConfig& config)
    : bus_(bus), warningThreshold_(config.powerUpWarning) {}

void PowerUpSystem::Reset() noexcept {
    wasActive_ = false;
    warningDispatched_ = false;
}

void PowerUpSystem::Execute(World& world) {
    if (world.GetState() != GameState::Playing) {
        return;
    }

    auto& registry = world.GetRegistry();
    const float remaining = world.GetPowerUpTime();
    const bool active = remaining > 0.0f;

    if (active && !wasActive_) {
        auto calmGhosts = registry.MakeQuery<GhostAI>();
        calmGhosts.Exclude(registry.Storage<Vulnerable>());
        for (Entity ghost : calmGhosts.Entities()) {
            registry.Add(ghost, Vulnerable{remaining, false});
        }
        warningDispatched_ = false;
        PACSIM_LOG_DEBUG(LogCategory::Gameplay, "power-up started, ghosts vulnerable");
    }

    if (active) {
        world.DecreasePowerUpTime(world.GetDeltaTime());
        const float left = world.GetPowerUpTime();
        const bool flash = left <= warningThreshold_;

        registry.MakeQuery<GhostAI, Vulnerable>().ForEach(
            [&](Entity, const GhostAI&, Vulnerable& vulnerable) {
                vulnerable.remainingTime = left;
                vulnerable.flashing = flash;
            });

        if (flash && !warningDispatched_) {
            warningDispatched_ = true;
            bus_.Publish(PowerUpWarning{left});
        }

        if (left == 0.0f) {
            for (Entity ghost : GetGhostEntities(world)) {
                registry.Remove<Vulnerable>(ghost);
            }
            world.ResetGhostEatenStreak();
            PACSIM_LOG_DEBUG(LogCategory::Gameplay, "power-up ended");
            bus_.Publish(PowerUpEnded{});
        }
    }

    wasActive_ = world.IsPowerUpActive();
}

} // namespace pacsim::game
