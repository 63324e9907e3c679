/// @file eating_system.cpp
/// @brief EatingSystem implementation.

#include "pacsim/game/eating_system.hpp"

#include <cmath>
#include <string>
#include <vector>

#include "pacsim/foundation/game_logger.hpp"
#include "pacsim/game/events.hpp"
#include "pacsim/game/selectors.hpp"

namespace pacsim::game {

using foundation::LogCategory;

EatingSystem::EatingSystem(foundation::EventBus& bus, const GameConfig& config)
    : bus_(bus), contactDistance_(config.ContactDistance()) {}

void EatingSystem::Execute(World& world) {
    if (world.GetState() != GameState::Playing) {
        return;
    }
    auto playerPos = GetPlayerPosition(world);
    if (!playerPos) {
        return;
    }

    auto& registry = world.GetRegistry();

    std::vector<Entity> eaten;
    registry.MakeQuery<Edible, Position>().ForEach(
        [&](Entity edible, const Edible&, const Position& pos) {
            const float dx = playerPos->pixelX - pos.pixelX;
            const float dy = playerPos->pixelY - pos.pixelY;
            if (std::sqrt(dx * dx + dy * dy) < contactDistance_) {
                eaten.push_back(edible);
            }
        });

    for (Entity entity : eaten) {
        const auto* edible = registry.Get<Edible>(entity);
        const auto* pos = registry.Get<Position>(entity);
        if (edible == nullptr || pos == nullptr) {
            continue;
        }
        const int points = edible->points;
        const GridPoint cell = pos->Cell();

        world.AddScore(points);

        if (const auto* powerUp = registry.Get<PowerUp>(entity)) {
            const float duration = powerUp->duration;
            world.SetPowerUpTime(duration);
            world.ResetGhostEatenStreak();

            PACSIM_LOG_DEBUG(LogCategory::Gameplay,
                             "power pellet eaten, power-up for " +
                                 std::to_string(static_cast<int>(duration)) + " ms");
            bus_.Publish(PowerPelletEaten{entity, cell, points, duration});
            bus_.Publish(PowerUpStarted{duration});
        } else {
            PACSIM_LOG_TRACE(LogCategory::Gameplay,
                             "pellet eaten at (" + std::to_string(cell.x) + "," +
                                 std::to_string(cell.y) + ")");
            bus_.Publish(PelletEaten{entity, cell, points});
        }

        registry.Destroy(entity);
    }

    if (!eaten.empty() && GetRemainingPelletCount(world) == 0) {
        world.SetState(GameState::Won);
        PACSIM_LOG_INFO(LogCategory::Gameplay,
                        "level " + std::to_string(world.GetLevel()) + " complete, score " +
                            std::to_string(world.GetScore()));
        bus_.Publish(LevelComplete{world.GetLevel(), world.GetScore()});
    }
}

} // namespace pacsim::game
