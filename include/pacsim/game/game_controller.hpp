#pragma once

/// @file game_controller.hpp
/// @brief GameController: composition root and session state machine.

#include <vector>

#include "pacsim/foundation/event_bus.hpp"
#include "pacsim/game/game_config.hpp"
#include "pacsim/game/game_system.hpp"

namespace pacsim::game {

class GhostAISystem;
class PowerUpSystem;

/// Owns the World, the EventBus and the system pipeline of one session.
///
/// Lifecycle:
///   Ready --Start--> Playing <--Pause/Resume--> Paused
///   Playing --death, lives left--> Dying --respawn delay--> Playing
///   Playing --last life--> Lost,  Playing --last pellet--> Won
///
/// Every Update() runs Input, GhostAI, Movement, Eating, PowerUp and
/// Collision in that order.  Eating and PowerUp precede Collision so a
/// ghost met on a power pellet is already vulnerable when contact is
/// resolved.
class GameController {
public:
    explicit GameController(const GameConfig& config = GameConfig{},
                            const Maze& maze = Maze::Classic());
    ~GameController();

    GameController(const GameController&) = delete;
    GameController& operator=(const GameController&) = delete;

    /// Reset the World and recreate the player, ghosts and collectibles.
    /// A nonzero GameConfig::randomSeed reseeds the frightened-ghost
    /// random source, so every session replays identically.  Leaves the
    /// game Ready.
    void Init();

    /// Advance the session by @p deltaMs milliseconds.
    ///
    /// A pending restart re-runs Init() and ends the tick.  While Dying
    /// only the respawn countdown advances.  While Playing without a
    /// power-up the scatter/chase timer advances.  The pipeline then
    /// runs once.
    void Update(float deltaMs);

    /// Ready -> Playing, publishing GameStarted.  Ignored in other states.
    void Start();

    /// Playing -> Paused, publishing GamePaused.
    void Pause();

    /// Paused -> Playing, publishing GameResumed.
    void Resume();

    /// Drop every subscription, including external listeners.
    void Destroy();

    [[nodiscard]] World& GetWorld() noexcept { return world_; }
    [[nodiscard]] const World& GetWorld() const noexcept { return world_; }
    [[nodiscard]] foundation::EventBus& GetEventBus() noexcept { return bus_; }
    [[nodiscard]] const GameConfig& GetConfig() const noexcept { return config_; }
    [[nodiscard]] GhostAISystem& GetGhostAI();

    /// Milliseconds left before a dying player respawns.
    [[nodiscard]] float GetRespawnTimer() const noexcept { return respawnTimer_; }

    /// True while the global ghost phase is Scatter.
    [[nodiscard]] bool IsScatterPhase() const noexcept { return scatterPhase_; }

private:
    void registerSystems();
    void resetPositions();
    void advanceModeTimer(float deltaMs);
    void resetSystems();

    GameConfig config_;
    World world_;
    foundation::EventBus bus_;
    GameScheduler scheduler_;

    std::vector<foundation::SubscriptionId> subscriptions_;

    float modeTimer_ = 0.0f;
    bool scatterPhase_ = true;
    float respawnTimer_ = 0.0f;
    bool needsReinit_ = false;
};

} // namespace pacsim::game
