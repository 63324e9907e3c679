#pragma once

/// @file eating_system.hpp
/// @brief EatingSystem: pellet consumption and level completion.

#include <string_view>

#include "pacsim/foundation/event_bus.hpp"
#include "pacsim/game/game_config.hpp"
#include "pacsim/game/game_system.hpp"

namespace pacsim::game {

/// Consumes every edible within contact distance of the player.
///
/// Each eaten entity scores its points and is destroyed.  A power pellet
/// also arms the World power-up timer, resets the ghost streak and
/// publishes PowerPelletEaten followed by PowerUpStarted; a plain pellet
/// publishes PelletEaten.  Eating the last edible sets the game to Won
/// and publishes LevelComplete.
class EatingSystem final : public GameSystem {
public:
    explicit EatingSystem(foundation::EventBus& bus, const GameConfig& config = GameConfig{});

    void Execute(World& world) override;

    [[nodiscard]] std::string_view GetName() const override { return "EatingSystem"; }

private:
    foundation::EventBus& bus_;
    float contactDistance_;
};

} // namespace pacsim::game
