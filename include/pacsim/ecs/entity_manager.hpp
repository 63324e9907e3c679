#pragma once

/// @file entity_manager.hpp
/// @brief Entity lifecycle management for the ECS.
///
/// EntityManager owns the canonical liveness state: creation from a
/// monotonic counter, idempotent destruction and alive-ness checks.
/// Component data lives in the Registry that wraps it.

#include "pacsim/ecs/entity.hpp"

#include <cstdint>
#include <vector>

namespace pacsim::ecs {

/// Issues entity identifiers and tracks which are alive.
///
/// Identifiers start at 0 and increase by one per Create(); they are
/// never reused by the same manager, including after Clear().
class EntityManager {
public:
    EntityManager() = default;

    // Non-copyable, movable.
    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;
    EntityManager(EntityManager&&) noexcept = default;
    EntityManager& operator=(EntityManager&&) noexcept = default;

    // ── Entity lifecycle ─────────────────────────────────────────────

    /// Create a new entity with the next identifier.
    [[nodiscard]] Entity Create();

    /// Mark @p entity dead.
    ///
    /// Destroying a dead, never-created or invalid entity is a no-op.
    /// @return true if the entity was alive before the call.
    bool Destroy(Entity entity);

    /// Destroy every live entity.  The identifier counter keeps running.
    void Clear();

    // ── Queries ──────────────────────────────────────────────────────

    [[nodiscard]] bool IsAlive(Entity entity) const noexcept;

    /// Number of currently alive entities.
    [[nodiscard]] std::size_t Count() const noexcept;

    /// Live entities in creation order.
    [[nodiscard]] std::vector<Entity> AllEntities() const;

private:
    /// Alive flag per identifier.
    std::vector<bool> alive_;

    /// Number of currently alive entities (cached for O(1) Count()).
    std::size_t count_ = 0;
};

}  // namespace pacsim::ecs
