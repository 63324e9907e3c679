#pragma once

/// @file component_storage.hpp
/// @brief Sparse-set based component storage for the ECS.
///
/// ComponentStorage<T> provides O(1) set / get / has / remove and
/// cache-friendly dense iteration over all components of type T.

#include "pacsim/ecs/entity.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace pacsim::ecs {

/// Type-erased base for component pools, allowing the registry to
/// remove, test and enumerate without knowing the component type.
class IComponentStorage {
public:
    virtual ~IComponentStorage() = default;

    virtual void Remove(Entity entity) = 0;
    [[nodiscard]] virtual bool Has(Entity entity) const = 0;
    virtual void Clear() = 0;
    [[nodiscard]] virtual std::size_t Size() const = 0;

    /// Return the entity stored at dense @p index.
    [[nodiscard]] virtual Entity EntityAt(std::size_t index) const = 0;
};

/// Sparse-set component storage.
///
/// Memory layout:
/// @code
///   sparse_  [entity.id] -> dense index  (or kInvalidIndex)
///   dense_   [index]     -> component data
///   entities_[index]     -> entity.id that owns dense_[index]
/// @endcode
///
/// Removal swaps with the last element, so dense order is not stable.
template <typename T>
class ComponentStorage final : public IComponentStorage {
public:
    static_assert(std::is_move_constructible_v<T>, "Component type must be move-constructible");

    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    // ── Capacity ────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t Size() const override { return dense_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return dense_.empty(); }

    // ── CRUD ────────────────────────────────────────────────────────────

    /// Store @p component for @p entity, replacing any existing value.
    /// @return Mutable reference to the stored component.
    T& Set(Entity entity, T component) {
        if (Has(entity)) {
            auto& slot = dense_[sparse_[entity.id()]];
            slot = std::move(component);
            return slot;
        }

        const auto idx = static_cast<uint32_t>(dense_.size());

        ensureSparseSize(entity.id());
        sparse_[entity.id()] = idx;

        dense_.push_back(std::move(component));
        entities_.push_back(entity.id());

        return dense_.back();
    }

    /// Pointer to the component owned by @p entity, or nullptr.
    [[nodiscard]] T* Find(Entity entity) {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] const T* Find(Entity entity) const {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] bool Has(Entity entity) const override {
        if (!entity.isValid()) {
            return false;
        }
        auto eid = entity.id();
        return eid < sparse_.size() && sparse_[eid] != kInvalidIndex;
    }

    /// Remove the component owned by @p entity.  No-op when absent.
    void Remove(Entity entity) override {
        if (!Has(entity)) {
            return;
        }

        auto idx = sparse_[entity.id()];
        auto lastIdx = static_cast<uint32_t>(dense_.size() - 1);

        if (idx != lastIdx) {
            // Swap the removed element with the last element.
            dense_[idx] = std::move(dense_[lastIdx]);
            entities_[idx] = entities_[lastIdx];
            sparse_[entities_[idx]] = idx;
        }

        dense_.pop_back();
        entities_.pop_back();
        sparse_[entity.id()] = kInvalidIndex;
    }

    void Clear() override {
        dense_.clear();
        entities_.clear();
        std::fill(sparse_.begin(), sparse_.end(), kInvalidIndex);
    }

    // ── Iteration ───────────────────────────────────────────────────────

    iterator begin() noexcept { return dense_.begin(); }
    iterator end() noexcept { return dense_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return dense_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return dense_.end(); }

    [[nodiscard]] Entity EntityAt(std::size_t index) const override {
        return Entity(entities_[index]);
    }

private:
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

    void ensureSparseSize(uint32_t entityId) {
        if (entityId >= sparse_.size()) {
            sparse_.resize(static_cast<std::size_t>(entityId) + 1, kInvalidIndex);
        }
    }

    std::vector<T> dense_;            ///< Packed component data.
    std::vector<uint32_t> entities_;  ///< dense index -> entity id.
    std::vector<uint32_t> sparse_;    ///< entity id  -> dense index.
};

}  // namespace pacsim::ecs
