#pragma once

/// @file system_scheduler.hpp
/// @brief Staged, dependency-ordered system execution for the ECS.
///
/// SystemScheduler<Context> owns a set of systems, groups them by stage
/// and orders each stage topologically from explicit dependencies.  Each
/// tick hands every system the same Context by reference, so
/// systems never reach for global state.

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "pacsim/foundation/game_logger.hpp"
#include "pacsim/foundation/game_result.hpp"

namespace pacsim::ecs {

// ── System type identification ──────────────────────────────────────────

/// Integer type used to identify system types at runtime.
using SystemTypeId = uint32_t;

constexpr SystemTypeId kInvalidSystemTypeId = static_cast<SystemTypeId>(-1);

namespace detail {

inline SystemTypeId nextSystemTypeId() noexcept {
    static std::atomic<SystemTypeId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

/// Obtain the unique SystemTypeId for system type `T`.
template <typename T>
struct SystemType {
    static SystemTypeId Id() noexcept {
        static const SystemTypeId value = detail::nextSystemTypeId();
        return value;
    }
};

// ── Execution stages ────────────────────────────────────────────────────

/// Stages run in declaration order every tick.
enum class SystemStage : uint8_t {
    PreUpdate,   ///< Input handling
    Update,      ///< Simulation
    PostUpdate   ///< Resolution of the tick's outcome
};

inline constexpr SystemStage kAllStages[] = {
    SystemStage::PreUpdate,
    SystemStage::Update,
    SystemStage::PostUpdate,
};

// ── System interface ────────────────────────────────────────────────────

/// Abstract base class for systems operating on a @p Context.
template <typename Context>
class ISystem {
public:
    virtual ~ISystem() = default;

    /// Advance this system by one tick.
    virtual void Execute(Context& context) = 0;

    [[nodiscard]] virtual SystemStage GetStage() const { return SystemStage::Update; }

    /// Human-readable name for diagnostics.
    [[nodiscard]] virtual std::string_view GetName() const = 0;
};

// ── Execution plan ──────────────────────────────────────────────────────

/// Type-independent bookkeeping behind SystemScheduler: stage membership,
/// dependency edges and the built order.
class ExecutionPlan {
public:
    /// Record a system.  Registering an id twice is a no-op.
    void AddSystem(SystemTypeId id, SystemStage stage, std::string name);

    [[nodiscard]] bool Contains(SystemTypeId id) const;

    /// Declare that `before` must execute before `after`.
    ///
    /// @return false if either system is unknown or they belong to
    ///         different stages.
    bool AddDependency(SystemTypeId before, SystemTypeId after);

    /// Topologically sort each stage (Kahn's algorithm).
    ///
    /// Ties keep registration order.  A cycle yields CircularDependency
    /// naming the systems involved.
    foundation::GameResult<void> Build();

    [[nodiscard]] bool IsBuilt() const noexcept { return built_; }

    [[nodiscard]] const std::vector<SystemTypeId>& GetExecutionOrder(SystemStage stage) const;

    [[nodiscard]] std::size_t SystemCount() const noexcept { return entries_.size(); }

private:
    struct Entry {
        SystemStage stage = SystemStage::Update;
        std::string name;
    };

    [[nodiscard]] foundation::GameResult<void> sortStage(
        const std::vector<SystemTypeId>& ids, std::vector<SystemTypeId>& sorted) const;

    std::unordered_map<SystemTypeId, Entry> entries_;

    /// Systems grouped by stage, in registration order.
    std::unordered_map<SystemStage, std::vector<SystemTypeId>> stageGroups_;

    /// dependencies_[A] contains all B where A must run before B.
    std::unordered_map<SystemTypeId, std::unordered_set<SystemTypeId>> dependencies_;

    /// reverseDeps_[B] contains all A where A must run before B.
    std::unordered_map<SystemTypeId, std::unordered_set<SystemTypeId>> reverseDeps_;

    std::unordered_map<SystemStage, std::vector<SystemTypeId>> executionOrder_;

    bool built_ = false;
};

// ── System scheduler ────────────────────────────────────────────────────

/// Owns systems and runs them in stage and dependency order.
///
/// Usage:
/// @code
///   SystemScheduler<World> scheduler;
///   scheduler.Register<MovementSystem>(maze);
///   scheduler.Register<EatingSystem>(bus);
///   scheduler.AddDependency<MovementSystem, EatingSystem>();
///   if (auto built = scheduler.Build(); !built) { ... }
///   scheduler.Execute(world);
/// @endcode
template <typename Context>
class SystemScheduler {
public:
    SystemScheduler() = default;

    // Non-copyable, movable.
    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;
    SystemScheduler(SystemScheduler&&) noexcept = default;
    SystemScheduler& operator=(SystemScheduler&&) noexcept = default;

    /// Construct and register a system of type `T`.
    ///
    /// Re-registering the same type returns the existing instance.
    template <typename T, typename... Args>
    T& Register(Args&&... args) {
        static_assert(std::is_base_of_v<ISystem<Context>, T>,
                      "T must derive from ISystem<Context>");

        const auto typeId = SystemType<T>::Id();
        if (auto it = systems_.find(typeId); it != systems_.end()) {
            return static_cast<T&>(*it->second);
        }

        auto system = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *system;
        plan_.AddSystem(typeId, ref.GetStage(), std::string(ref.GetName()));
        systems_.emplace(typeId, std::move(system));
        return ref;
    }

    template <typename Before, typename After>
    bool AddDependency() {
        return plan_.AddDependency(SystemType<Before>::Id(), SystemType<After>::Id());
    }

    /// Build the execution plan.  Must succeed before Execute() runs anything.
    foundation::GameResult<void> Build() { return plan_.Build(); }

    /// Run every system once, stage by stage.
    ///
    /// Builds the plan first if registrations changed since the last
    /// Build(); a plan that cannot be built runs nothing and is logged.
    void Execute(Context& context) {
        if (!plan_.IsBuilt()) {
            auto built = plan_.Build();
            if (!built) {
                PACSIM_LOG_ERROR(foundation::LogCategory::ECS,
                                 std::string(built.error().message()));
                return;
            }
        }

        for (auto stage : kAllStages) {
            for (auto typeId : plan_.GetExecutionOrder(stage)) {
                systems_.at(typeId)->Execute(context);
            }
        }
    }

    /// Registered system of type T, or nullptr.
    template <typename T>
    [[nodiscard]] T* GetSystem() {
        auto it = systems_.find(SystemType<T>::Id());
        return it == systems_.end() ? nullptr : static_cast<T*>(it->second.get());
    }

    [[nodiscard]] const std::vector<SystemTypeId>& GetExecutionOrder(SystemStage stage) const {
        return plan_.GetExecutionOrder(stage);
    }

    [[nodiscard]] std::size_t SystemCount() const noexcept { return plan_.SystemCount(); }

private:
    ExecutionPlan plan_;
    std::unordered_map<SystemTypeId, std::unique_ptr<ISystem<Context>>> systems_;
};

} // namespace pacsim::ecs
