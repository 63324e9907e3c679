#pragma once

/// @file selectors.hpp
/// @brief Read-only queries over a World for presentation code.
///
/// Selectors never mutate.  Missing entities yield nullopt, false or
/// empty results.

#include <optional>
#include <vector>

#include "pacsim/game/world.hpp"

namespace pacsim::game {

// ── Player ──────────────────────────────────────────────────────────────

[[nodiscard]] std::optional<Entity> GetPlayerEntity(const World& world);
[[nodiscard]] std::optional<Position> GetPlayerPosition(const World& world);
[[nodiscard]] std::optional<Direction> GetPlayerDirection(const World& world);
[[nodiscard]] float GetPlayerSpeed(const World& world);
[[nodiscard]] bool IsPlayerAlive(const World& world);

// ── Ghosts ──────────────────────────────────────────────────────────────

/// Snapshot of one ghost for rendering.
struct GhostState {
    Entity entity;
    GhostType type = GhostType::Blinky;
    GhostMode mode = GhostMode::Scatter;
    Position position;
    bool vulnerable = false;
    bool flashing = false;
};

[[nodiscard]] std::vector<Entity> GetGhostEntities(const World& world);
[[nodiscard]] std::optional<Position> GetGhostPosition(const World& world, Entity ghost);
[[nodiscard]] std::optional<GhostMode> GetGhostMode(const World& world, Entity ghost);
[[nodiscard]] std::optional<GhostType> GetGhostType(const World& world, Entity ghost);

/// True while the ghost carries Vulnerable with time left.
[[nodiscard]] bool IsGhostVulnerable(const World& world, Entity ghost);
[[nodiscard]] bool IsGhostFlashing(const World& world, Entity ghost);

[[nodiscard]] std::optional<Entity> FindGhostByType(const World& world, GhostType type);

/// States of all ghosts, ordered by entity id.
[[nodiscard]] std::vector<GhostState> GetAllGhostStates(const World& world);

// ── Collectibles ────────────────────────────────────────────────────────

[[nodiscard]] std::vector<Entity> GetAllPellets(const World& world);
[[nodiscard]] std::vector<Entity> GetPowerPellets(const World& world);
[[nodiscard]] std::size_t GetRemainingPelletCount(const World& world);

// ── Session ─────────────────────────────────────────────────────────────

[[nodiscard]] inline int GetScore(const World& world) { return world.GetScore(); }
[[nodiscard]] inline int GetLives(const World& world) { return world.GetLives(); }
[[nodiscard]] inline int GetLevel(const World& world) { return world.GetLevel(); }
[[nodiscard]] inline GameState GetGameState(const World& world) { return world.GetState(); }
[[nodiscard]] inline float GetPowerUpTimeRemaining(const World& world) {
    return world.GetPowerUpTime();
}
[[nodiscard]] inline bool IsPowerUpActive(const World& world) { return world.IsPowerUpActive(); }

[[nodiscard]] inline bool IsGameOver(const World& world) {
    return world.GetState() == GameState::Lost;
}
[[nodiscard]] inline bool IsGameWon(const World& world) {
    return world.GetState() == GameState::Won;
}
[[nodiscard]] inline bool IsPlaying(const World& world) {
    return world.GetState() == GameState::Playing;
}
[[nodiscard]] inline bool IsPaused(const World& world) {
    return world.GetState() == GameState::Paused;
}
[[nodiscard]] inline bool IsReady(const World& world) {
    return world.GetState() == GameState::Ready;
}

} // namespace pacsim::game
