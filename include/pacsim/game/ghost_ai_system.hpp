#pragma once

/// @file ghost_ai_system.hpp
/// @brief GhostAISystem: per-ghost mode resolution and path choice.

#include <optional>
#include <random>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "pacsim/foundation/event_bus.hpp"
#include "pacsim/game/game_config.hpp"
#include "pacsim/game/game_system.hpp"

namespace pacsim::game {

/// Drives the four ghosts.
///
/// Listens for GhostModeChanged, PowerUpStarted, PowerUpEnded and
/// GhostEaten.  Each Playing tick, for every ghost:
///   - Resolve its mode: Eaten while returning home, Frightened while
///     vulnerable or a power-up is running, otherwise the global mode.
///   - On a mode-change tick, reverse immediately and skip path choice.
///   - When within kPlanTolerance of a cell center, or idle, pick the
///     next direction: random while frightened, else the non-reversing
///     neighbour closest to the target (ties: up, left, down, right).
class GhostAISystem final : public GameSystem {
public:
    /// Pixel distance from a cell center within which ghosts re-plan.
    static constexpr float kPlanTolerance = 2.0f;

    explicit GhostAISystem(foundation::EventBus& bus, const GameConfig& config = GameConfig{});
    ~GhostAISystem() override;

    GhostAISystem(const GhostAISystem&) = delete;
    GhostAISystem& operator=(const GhostAISystem&) = delete;

    void Execute(World& world) override;

    [[nodiscard]] std::string_view GetName() const override { return "GhostAISystem"; }

    /// Target cell @p ghost is heading for, or nullopt when it wanders
    /// (frightened or vulnerable) or is not a ghost.
    [[nodiscard]] std::optional<GridPoint> TargetFor(const World& world, Entity ghost) const;

    /// Forget pending eaten ghosts and return to Scatter with no pending
    /// reversal.
    void Reset();

    [[nodiscard]] GhostMode GetGlobalMode() const noexcept { return globalMode_; }
    [[nodiscard]] bool IsReturningHome(Entity ghost) const { return eatenGhosts_.count(ghost) > 0; }

    /// Reseed the frightened-mode random source.
    void Seed(uint32_t seed) { rng_.seed(seed); }

private:
    void updateGhost(World& world, Entity ghost);

    [[nodiscard]] std::vector<Direction> availableDirections(const Maze& maze, GridPoint from,
                                                             std::optional<Direction> current) const;
    [[nodiscard]] std::optional<Direction> chooseTowardTarget(const Maze& maze, GridPoint from,
                                                              GridPoint target,
                                                              std::optional<Direction> current) const;
    [[nodiscard]] std::optional<Direction> chooseRandom(const Maze& maze, GridPoint from,
                                                        std::optional<Direction> current);

    foundation::EventBus& bus_;
    GameConfig config_;
    std::vector<foundation::SubscriptionId> subscriptions_;

    GhostMode globalMode_ = GhostMode::Scatter;
    bool modeJustChanged_ = false;
    bool frightenedActive_ = false;
    std::unordered_set<Entity> eatenGhosts_;

    std::mt19937 rng_;
};

} // namespace pacsim::game
