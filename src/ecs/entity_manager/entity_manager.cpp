/// @file entity_manager.cpp
/// @brief Entity lifecycle management implementation.

#include "pacsim/ecs/entity_manager.hpp"

#include <algorithm>

namespace pacsim::ecs {

// ── Entity lifecycle ─────────────────────────────────────────────────

Entity EntityManager::Create() {
    const auto index = static_cast<uint32_t>(alive_.size());
    alive_.push_back(true);
    ++count_;
    return Entity(index);
}

bool EntityManager::Destroy(Entity entity) {
    if (!IsAlive(entity)) {
        return false;
    }
    alive_[entity.id()] = false;
    --count_;
    return true;
}

void EntityManager::Clear() {
    std::fill(alive_.begin(), alive_.end(), false);
    count_ = 0;
}

// ── Queries ──────────────────────────────────────────────────────────

bool EntityManager::IsAlive(Entity entity) const noexcept {
    if (!entity.isValid()) {
        return false;
    }
    const auto idx = entity.id();
    return idx < alive_.size() && alive_[idx];
}

std::size_t EntityManager::Count() const noexcept {
    return count_;
}

std::vector<Entity> EntityManager::AllEntities() const {
    std::vector<Entity> result;
    result.reserve(count_);
    for (uint32_t i = 0; i < alive_.size(); ++i) {
        if (alive_[i]) {
            result.emplace_back(i);
        }
    }
    return result;
}

} // namespace pacsim::ecs
