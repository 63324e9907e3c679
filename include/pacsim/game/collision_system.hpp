#pragma once

/// @file collision_system.hpp
/// @brief CollisionSystem: player/ghost contact resolution.

#include <array>
#include <string_view>

#include "pacsim/foundation/event_bus.hpp"
#include "pacsim/game/game_config.hpp"
#include "pacsim/game/game_system.hpp"

namespace pacsim::game {

/// Resolves contact between the player and ghosts that are not Eaten.
///
/// A vulnerable ghost is eaten: the streak grows, points follow
/// kGhostPoints (capped at the last entry), Vulnerable is removed, the
/// ghost turns Eaten and GhostEaten is published.  Several ghosts can
/// be eaten in one tick.  Touching a non-vulnerable ghost costs a life
/// and publishes PlayerDied (plus GameOver when no lives remain), after
/// which no further contacts are handled that tick.
class CollisionSystem final : public GameSystem {
public:
    static constexpr std::array<int, 4> kGhostPoints = {200, 400, 800, 1600};

    explicit CollisionSystem(foundation::EventBus& bus, const GameConfig& config = GameConfig{});

    void Execute(World& world) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::PostUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "CollisionSystem"; }

    /// Points for the @p streak-th ghost eaten during one power-up.
    [[nodiscard]] static int PointsForStreak(int streak) noexcept;

private:
    foundation::EventBus& bus_;
    float contactDistance_;
};

} // namespace pacsim::game
