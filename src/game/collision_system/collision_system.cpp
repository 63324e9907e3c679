/// @file collision_system.cpp
/// @brief CollisionSystem implementation.

#include "pacsim/game/collision_system.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pacsim/foundation/game_logger.hpp"
#include "pacsim/game/events.hpp"
#include "pacsim/game/selectors.hpp"

namespace pacsim::game {

using foundation::GameLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

/// Contact outcomes are logged with the ghost as the context entity.
void logContact(LogLevel level, std::string_view msg, Entity ghost,
                std::initializer_list<std::pair<const char*, std::string>> fields) {
    auto& logger = GameLogger::instance();
    if (!logger.isEnabled(level, LogCategory::Gameplay)) {
        return;
    }
    LogContext ctx;
    ctx.entityId = ghost.id();
    for (const auto& [key, value] : fields) {
        ctx.extra[key] = value;
    }
    logger.logWithContext(level, LogCategory::Gameplay, msg, ctx);
}

} // namespace

CollisionSystem::CollisionSystem(foundation::EventBus& bus, const GameConfig& config)
    : bus_(bus), contactDistance_(config.ContactDistance()) {}

int CollisionSystem::PointsForStreak(int streak) noexcept {
    const int last = static_cast<int>(kGhostPoints.size()) - 1;
    const int index = std::clamp(streak - 1, 0, last);
    return kGhostPoints[static_cast<std::size_t>(index)];
}

void CollisionSystem::Execute(World& world) {
    if (world.GetState() != GameState::Playing) {
        return;
    }
    auto playerPos = GetPlayerPosition(world);
    if (!playerPos) {
        return;
    }

    auto& registry = world.GetRegistry();

    std::vector<Entity> colliding;
    for (Entity ghost : GetGhostEntities(world)) {
        const auto* ai = registry.Get<GhostAI>(ghost);
        const auto* pos = registry.Get<Position>(ghost);
        if (ai == nullptr || pos == nullptr || ai->mode == GhostMode::Eaten) {
            continue;
        }
        const float dx = playerPos->pixelX - pos->pixelX;
        const float dy = playerPos->pixelY - pos->pixelY;
        if (std::sqrt(dx * dx + dy * dy) < contactDistance_) {
            colliding.push_back(ghost);
        }
    }

    for (Entity ghost : colliding) {
        if (IsGhostVulnerable(world, ghost)) {
            world.IncrementGhostEatenStreak();
            const int streak = world.GetGhostEatenStreak();
            const int points = PointsForStreak(streak);
            world.AddScore(points);

            registry.Remove<Vulnerable>(ghost);

            GhostType type = GhostType::Blinky;
            if (auto* ai = registry.Get<GhostAI>(ghost)) {
                ai->mode = GhostMode::Eaten;
                type = ai->type;
            }

            GridPoint cell;
            if (const auto* pos = registry.Get<Position>(ghost)) {
                cell = pos->Cell();
            }

            logContact(LogLevel::Debug, "ghost eaten", ghost,
                       {{"ghost", std::string(ToString(type))},
                        {"points", std::to_string(points)},
                        {"streak", std::to_string(streak)}});
            bus_.Publish(GhostEaten{ghost, type, points, streak, cell});
            continue;
        }

        world.LoseLife();
        const int lives = world.GetLives();
        logContact(LogLevel::Info, "player caught", ghost, {{"lives", std::to_string(lives)}});
        bus_.Publish(PlayerDied{lives});

        if (lives == 0) {
            world.SetState(GameState::Lost);
            PACSIM_LOG_INFO(LogCategory::Gameplay,
                            "game over, final score " + std::to_string(world.GetScore()));
            bus_.Publish(GameOver{world.GetScore(), world.GetLevel()});
        }
        break;
    }
}

} // namespace pacsim::game
