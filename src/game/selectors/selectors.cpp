/// @file selectors.cpp
/// @brief Read-only World queries.

#include "pacsim/game/selectors.hpp"

#include <algorithm>

namespace pacsim::game {

namespace {

std::vector<Entity> sortedById(std::vector<Entity> entities) {
    std::sort(entities.begin(), entities.end());
    return entities;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Player
// ═══════════════════════════════════════════════════════════════════════════

std::optional<Entity> GetPlayerEntity(const World& world) {
    auto players = world.GetRegistry().QueryEntities<PlayerControlled>();
    if (players.empty()) {
        return std::nullopt;
    }
    return *std::min_element(players.begin(), players.end());
}

std::optional<Position> GetPlayerPosition(const World& world) {
    auto player = GetPlayerEntity(world);
    if (!player) {
        return std::nullopt;
    }
    const auto* pos = world.GetRegistry().Get<Position>(*player);
    if (pos == nullptr) {
        return std::nullopt;
    }
    return *pos;
}

std::optional<Direction> GetPlayerDirection(const World& world) {
    auto player = GetPlayerEntity(world);
    if (!player) {
        return std::nullopt;
    }
    const auto* vel = world.GetRegistry().Get<Velocity>(*player);
    return vel != nullptr ? vel->direction : std::nullopt;
}

float GetPlayerSpeed(const World& world) {
    auto player = GetPlayerEntity(world);
    if (!player) {
        return 0.0f;
    }
    const auto* vel = world.GetRegistry().Get<Velocity>(*player);
    return vel != nullptr ? vel->speed : 0.0f;
}

bool IsPlayerAlive(const World& world) {
    auto player = GetPlayerEntity(world);
    return player.has_value() && world.GetRegistry().IsAlive(*player);
}

// ═══════════════════════════════════════════════════════════════════════════
// Ghosts
// ═══════════════════════════════════════════════════════════════════════════

std::vector<Entity> GetGhostEntities(const World& world) {
    return sortedById(world.GetRegistry().QueryEntities<GhostAI>());
}

std::optional<Position> GetGhostPosition(const World& world, Entity ghost) {
    const auto& registry = world.GetRegistry();
    if (!registry.Has<GhostAI>(ghost)) {
        return std::nullopt;
    }
    const auto* pos = registry.Get<Position>(ghost);
    if (pos == nullptr) {
        return std::nullopt;
    }
    return *pos;
}

std::optional<GhostMode> GetGhostMode(const World& world, Entity ghost) {
    const auto* ai = world.GetRegistry().Get<GhostAI>(ghost);
    if (ai == nullptr) {
        return std::nullopt;
    }
    return ai->mode;
}

std::optional<GhostType> GetGhostType(const World& world, Entity ghost) {
    const auto* ai = world.GetRegistry().Get<GhostAI>(ghost);
    if (ai == nullptr) {
        return std::nullopt;
    }
    return ai->type;
}

bool IsGhostVulnerable(const World& world, Entity ghost) {
    const auto* vulnerable = world.GetRegistry().Get<Vulnerable>(ghost);
    return vulnerable != nullptr && vulnerable->remainingTime > 0.0f;
}

bool IsGhostFlashing(const World& world, Entity ghost) {
    const auto* vulnerable = world.GetRegistry().Get<Vulnerable>(ghost);
    return vulnerable != nullptr && vulnerable->flashing;
}

std::optional<Entity> FindGhostByType(const World& world, GhostType type) {
    for (Entity ghost : GetGhostEntities(world)) {
        const auto* ai = world.GetRegistry().Get<GhostAI>(ghost);
        if (ai != nullptr && ai->type == type) {
            return ghost;
        }
    }
    return std::nullopt;
}

std::vector<GhostState> GetAllGhostStates(const World& world) {
    const auto& registry = world.GetRegistry();
    std::vector<GhostState> states;
    for (Entity ghost : GetGhostEntities(world)) {
        const auto* ai = registry.Get<GhostAI>(ghost);
        const auto* pos = registry.Get<Position>(ghost);
        if (ai == nullptr || pos == nullptr) {
            continue;
        }
        states.push_back(GhostState{ghost, ai->type, ai->mode, *pos,
                                    IsGhostVulnerable(world, ghost),
                                    IsGhostFlashing(world, ghost)});
    }
    return states;
}

// ═══════════════════════════════════════════════════════════════════════════
// Collectibles
// ═══════════════════════════════════════════════════════════════════════════

std::vector<Entity> GetAllPellets(const World& world) {
    return sortedById(world.GetRegistry().QueryEntities<Edible, Position>());
}

std::vector<Entity> GetPowerPellets(const World& world) {
    return sortedById(world.GetRegistry().QueryEntities<Edible, PowerUp, Position>());
}

std::size_t GetRemainingPelletCount(const World& world) {
    return world.GetRegistry().Storage<Edible>().Size();
}

} // namespace pacsim::game
