/// @file system_scheduler.cpp
/// @brief Execution plan: stage grouping and dependency ordering.
///
/// Each stage is sorted independently with Kahn's algorithm.  Circular
/// dependencies are reported with the names of the involved systems.

#include "pacsim/ecs/system_scheduler.hpp"

#include <queue>
#include <sstream>

namespace pacsim::ecs {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {
const std::vector<SystemTypeId> kEmptyOrder;
} // namespace

// ── Registration ────────────────────────────────────────────────────────

void ExecutionPlan::AddSystem(SystemTypeId id, SystemStage stage, std::string name) {
    if (entries_.count(id) != 0) {
        return;
    }
    entries_.emplace(id, Entry{stage, std::move(name)});
    stageGroups_[stage].push_back(id);
    built_ = false;
}

bool ExecutionPlan::Contains(SystemTypeId id) const {
    return entries_.count(id) != 0;
}

// ── Dependencies ────────────────────────────────────────────────────────

bool ExecutionPlan::AddDependency(SystemTypeId before, SystemTypeId after) {
    auto itBefore = entries_.find(before);
    auto itAfter = entries_.find(after);

    if (itBefore == entries_.end() || itAfter == entries_.end()) {
        return false;
    }

    // Stage order already sequences systems in different stages.
    if (itBefore->second.stage != itAfter->second.stage) {
        return false;
    }

    dependencies_[before].insert(after);
    reverseDeps_[after].insert(before);
    built_ = false;
    return true;
}

// ── Build ───────────────────────────────────────────────────────────────

GameResult<void> ExecutionPlan::Build() {
    executionOrder_.clear();

    for (const auto& [stage, ids] : stageGroups_) {
        std::vector<SystemTypeId> sorted;
        auto result = sortStage(ids, sorted);
        if (!result) {
            built_ = false;
            return result;
        }
        executionOrder_[stage] = std::move(sorted);
    }

    built_ = true;
    return GameResult<void>::ok();
}

GameResult<void> ExecutionPlan::sortStage(const std::vector<SystemTypeId>& ids,
                                          std::vector<SystemTypeId>& sorted) const {
    std::unordered_set<SystemTypeId> stageSet(ids.begin(), ids.end());

    std::unordered_map<SystemTypeId, uint32_t> inDegree;
    for (auto id : ids) {
        inDegree[id] = 0;
    }
    for (auto id : ids) {
        if (auto it = reverseDeps_.find(id); it != reverseDeps_.end()) {
            for (auto dep : it->second) {
                if (stageSet.contains(dep)) {
                    ++inDegree[id];
                }
            }
        }
    }

    // Seed in registration order so independent systems keep it.
    std::queue<SystemTypeId> ready;
    for (auto id : ids) {
        if (inDegree[id] == 0) {
            ready.push(id);
        }
    }

    sorted.clear();
    sorted.reserve(ids.size());

    while (!ready.empty()) {
        auto current = ready.front();
        ready.pop();
        sorted.push_back(current);

        auto it = dependencies_.find(current);
        if (it == dependencies_.end()) {
            continue;
        }
        // Release successors in registration order for a deterministic plan.
        for (auto candidate : ids) {
            if (it->second.count(candidate) == 0) {
                continue;
            }
            if (--inDegree[candidate] == 0) {
                ready.push(candidate);
            }
        }
    }

    if (sorted.size() != ids.size()) {
        std::ostringstream oss;
        oss << "Circular dependency detected among systems: [";
        bool first = true;
        for (auto id : ids) {
            if (inDegree[id] != 0) {
                if (!first) {
                    oss << ", ";
                }
                oss << entries_.at(id).name;
                first = false;
            }
        }
        oss << "]";
        return GameResult<void>::err(GameError(ErrorCode::CircularDependency, oss.str()));
    }

    return GameResult<void>::ok();
}

// ── Queries ─────────────────────────────────────────────────────────────

const std::vector<SystemTypeId>& ExecutionPlan::GetExecutionOrder(SystemStage stage) const {
    auto it = executionOrder_.find(stage);
    return it == executionOrder_.end() ? kEmptyOrder : it->second;
}

}  // namespace pacsim::ecs
