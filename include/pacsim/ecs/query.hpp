#pragma once

/// @file query.hpp
/// @brief Multi-component query over sparse-set storages.
///
/// Query<Includes...> yields the entities that own every listed component
/// type, optionally skipping entities that own an excluded type.

#include <array>
#include <cstddef>
#include <limits>
#include <tuple>
#include <vector>

#include "pacsim/ecs/component_storage.hpp"
#include "pacsim/ecs/entity.hpp"

namespace pacsim::ecs {

namespace detail {

/// Entities present in every storage of @p includes and in none of
/// @p excludes.  Scans the smallest include storage.
template <std::size_t N>
std::vector<Entity> collectMatching(const std::array<const IComponentStorage*, N>& includes,
                                    const std::vector<const IComponentStorage*>& excludes) {
    std::vector<Entity> result;

    const IComponentStorage* smallest = nullptr;
    std::size_t smallestSize = std::numeric_limits<std::size_t>::max();
    for (const auto* storage : includes) {
        if (storage->Size() < smallestSize) {
            smallest = storage;
            smallestSize = storage->Size();
        }
    }

    if (smallest == nullptr || smallestSize == 0) {
        return result;
    }

    result.reserve(smallestSize);
    for (std::size_t i = 0; i < smallestSize; ++i) {
        const Entity entity = smallest->EntityAt(i);

        bool matches = true;
        for (const auto* storage : includes) {
            if (storage != smallest && !storage->Has(entity)) {
                matches = false;
                break;
            }
        }
        for (const auto* storage : excludes) {
            if (!matches) {
                break;
            }
            if (storage->Has(entity)) {
                matches = false;
            }
        }

        if (matches) {
            result.push_back(entity);
        }
    }
    return result;
}

} // namespace detail

/// Component view over a fixed set of storages.
///
/// The matching set is computed when iteration starts.  ForEach re-checks
/// each entity before invoking the callback, so an earlier callback may
/// remove components or destroy entities without invalidating the rest of
/// the pass; affected entities are skipped.
///
/// Usage:
/// @code
///   Query<Position, Velocity> movers(positions, velocities);
///   movers.ForEach([](Entity e, Position& pos, Velocity& vel) {
///       pos.pixelX += vel.speed;
///   });
/// @endcode
template <typename... Includes>
class Query {
    static_assert(sizeof...(Includes) > 0,
                  "Query must have at least one component type");

public:
    explicit Query(ComponentStorage<Includes>&... storages)
        : storages_{&storages...} {}

    /// Skip entities that have a component in @p storage.
    Query& Exclude(const IComponentStorage& storage) {
        excludes_.push_back(&storage);
        return *this;
    }

    /// Invoke @p func(Entity, Includes&...) for every matching entity.
    template <typename Func>
    void ForEach(Func&& func) {
        for (Entity e : Entities()) {
            const bool stillPresent = std::apply(
                [&](auto*... ptrs) { return (ptrs->Has(e) && ...); }, storages_);
            if (!stillPresent) {
                continue;
            }
            func(e, *std::get<ComponentStorage<Includes>*>(storages_)->Find(e)...);
        }
    }

    /// Snapshot of the currently matching entities.
    [[nodiscard]] std::vector<Entity> Entities() const {
        std::array<const IComponentStorage*, sizeof...(Includes)> includes{};
        std::apply(
            [&](auto*... ptrs) {
                std::size_t i = 0;
                ((includes[i++] = ptrs), ...);
            },
            storages_);
        return detail::collectMatching(includes, excludes_);
    }

    [[nodiscard]] std::size_t Count() const { return Entities().size(); }

private:
    std::tuple<ComponentStorage<Includes>*...> storages_;
    std::vector<const IComponentStorage*> excludes_;
};

} // namespace pacsim::ecs
