#pragma once

/// @file entity.hpp
/// @brief Entity handle for the ECS layer.
///
/// An entity is an opaque 32-bit identifier handed out by a monotonically
/// increasing counter.  Identifiers are never recycled within one
/// EntityManager, so a handle to a destroyed entity stays dead forever.

#include <cstdint>
#include <functional>
#include <limits>

namespace pacsim::ecs {

struct Entity {
    uint32_t raw = kInvalidRaw;

    static constexpr uint32_t kInvalidRaw = std::numeric_limits<uint32_t>::max();

    /// Default-construct to the invalid sentinel.
    constexpr Entity() = default;

    constexpr explicit Entity(uint32_t id) : raw(id) {}

    [[nodiscard]] constexpr uint32_t id() const noexcept { return raw; }

    /// True when this handle could refer to a live entity.
    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    [[nodiscard]] static constexpr Entity invalid() noexcept { return Entity{}; }

    constexpr auto operator<=>(const Entity&) const = default;
};

static_assert(sizeof(Entity) == 4, "Entity must be exactly 32 bits");

} // namespace pacsim::ecs

// Hash support for unordered containers.
template <>
struct std::hash<pacsim::ecs::Entity> {
    std::size_t operator()(const pacsim::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
