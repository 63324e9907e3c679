#pragma once

/// @file registry.hpp
/// @brief Entity registry over a closed set of component types.
///
/// Registry<Components...> combines an EntityManager with one sparse-set
/// storage per component type.  The component set is fixed at compile
/// time: asking for a type outside it does not compile.

#include <array>
#include <tuple>
#include <utility>
#include <vector>

#include "pacsim/ecs/component_storage.hpp"
#include "pacsim/ecs/entity.hpp"
#include "pacsim/ecs/entity_manager.hpp"
#include "pacsim/ecs/query.hpp"

namespace pacsim::ecs {

/// Owns entities and their components.
///
/// Every operation tolerates stale handles: adding to a dead entity,
/// reading a missing component or destroying twice are silent no-ops
/// (or nullptr / false results), never errors.
///
/// Usage:
/// @code
///   Registry<Position, Velocity> registry;
///   auto e = registry.Create();
///   registry.Add(e, Position{1, 1, 30.0f, 30.0f});
///   for (Entity moving : registry.QueryEntities<Position, Velocity>()) { ... }
/// @endcode
template <typename... Components>
class Registry {
public:
    Registry() = default;

    // Non-copyable, movable.
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) noexcept = default;
    Registry& operator=(Registry&&) noexcept = default;

    // ── Entity lifecycle ─────────────────────────────────────────────

    [[nodiscard]] Entity Create() { return entities_.Create(); }

    /// Destroy @p entity and purge all of its components.
    void Destroy(Entity entity) {
        if (entities_.Destroy(entity)) {
            (Storage<Components>().Remove(entity), ...);
        }
    }

    [[nodiscard]] bool IsAlive(Entity entity) const noexcept {
        return entities_.IsAlive(entity);
    }

    [[nodiscard]] std::size_t Count() const noexcept { return entities_.Count(); }

    [[nodiscard]] std::vector<Entity> AllEntities() const { return entities_.AllEntities(); }

    /// Destroy every entity.  Identifiers are not reused afterwards.
    void Clear() {
        entities_.Clear();
        (Storage<Components>().Clear(), ...);
    }

    // ── Components ───────────────────────────────────────────────────

    /// Attach or replace a component.
    /// @return The stored component, or nullptr if @p entity is not alive.
    template <typename T>
    T* Add(Entity entity, T component) {
        if (!entities_.IsAlive(entity)) {
            return nullptr;
        }
        return &Storage<T>().Set(entity, std::move(component));
    }

    template <typename T>
    [[nodiscard]] T* Get(Entity entity) {
        return Storage<T>().Find(entity);
    }

    template <typename T>
    [[nodiscard]] const T* Get(Entity entity) const {
        return Storage<T>().Find(entity);
    }

    template <typename T>
    void Remove(Entity entity) {
        Storage<T>().Remove(entity);
    }

    template <typename T>
    [[nodiscard]] bool Has(Entity entity) const {
        return Storage<T>().Has(entity);
    }

    // ── Queries ──────────────────────────────────────────────────────

    /// Live entities holding every component in Ts.  Order is unspecified.
    template <typename... Ts>
    [[nodiscard]] std::vector<Entity> QueryEntities() const {
        std::array<const IComponentStorage*, sizeof...(Ts)> includes{&Storage<Ts>()...};
        return detail::collectMatching(includes, {});
    }

    /// A Query view bound to this registry's storages.
    template <typename... Ts>
    [[nodiscard]] Query<Ts...> MakeQuery() {
        return Query<Ts...>(Storage<Ts>()...);
    }

    template <typename T>
    [[nodiscard]] ComponentStorage<T>& Storage() {
        return std::get<ComponentStorage<T>>(storages_);
    }

    template <typename T>
    [[nodiscard]] const ComponentStorage<T>& Storage() const {
        return std::get<ComponentStorage<T>>(storages_);
    }

private:
    EntityManager entities_;
    std::tuple<ComponentStorage<Components>...> storages_;
};

} // namespace pacsim::ecs
