/// @file ghost_ai_system.cpp
/// @brief GhostAISystem implementation.

#include "pacsim/game/ghost_ai_system.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "pacsim/foundation/game_logger.hpp"
#include "pacsim/game/events.hpp"
#include "pacsim/game/movement_system.hpp"
#include "pacsim/game/selectors.hpp"

namespace pacsim::game {

using foundation::LogCategory;

namespace {

/// Tie-break order for target seeking.
constexpr std::array<Direction, 4> kTargetPriority = {
    Direction::Up, Direction::Left, Direction::Down, Direction::Right
};

int distanceSquared(GridPoint a, GridPoint b) {
    const int dx = b.x - a.x;
    const int dy = b.y - a.y;
    return dx * dx + dy * dy;
}

/// @p from moved @p tiles along @p dir.  Moving up also shifts left,
/// matching the arcade ambush offset.
GridPoint ambushOffset(GridPoint from, std::optional<Direction> dir, int tiles) {
    if (!dir) {
        return from;
    }
    if (*dir == Direction::Up) {
        return {from.x - tiles, from.y - tiles};
    }
    return Step(from, *dir, tiles);
}

} // namespace

GhostAISystem::GhostAISystem(foundation::EventBus& bus, const GameConfig& config)
    : bus_(bus), config_(config) {
    if (config_.randomSeed != 0) {
        rng_.seed(config_.randomSeed);
    } else {
        rng_.seed(std::random_device{}());
    }

    subscriptions_.push_back(bus_.Subscribe<GhostModeChanged>([this](const GhostModeChanged& e) {
        globalMode_ = e.mode;
        modeJustChanged_ = true;
    }));
    subscriptions_.push_back(bus_.Subscribe<PowerUpStarted>([this](const PowerUpStarted&) {
        frightenedActive_ = true;
        modeJustChanged_ = true;
    }));
    subscriptions_.push_back(bus_.Subscribe<PowerUpEnded>([this](const PowerUpEnded&) {
        frightenedActive_ = false;
        modeJustChanged_ = true;
    }));
    subscriptions_.push_back(bus_.Subscribe<GhostEaten>(
        [this](const GhostEaten& e) { eatenGhosts_.insert(e.ghost); }));
}

GhostAISystem::~GhostAISystem() {
    for (auto id : subscriptions_) {
        bus_.Unsubscribe(id);
    }
}

void GhostAISystem::Reset() {
    globalMode_ = GhostMode::Scatter;
    modeJustChanged_ = false;
    frightenedActive_ = false;
    eatenGhosts_.clear();
}

// ═══════════════════════════════════════════════════════════════════════════
// Targeting
// ═══════════════════════════════════════════════════════════════════════════

std::optional<GridPoint> GhostAISystem::TargetFor(const World& world, Entity ghost) const {
    const auto& registry = world.GetRegistry();
    const auto* ai = registry.Get<GhostAI>(ghost);
    if (ai == nullptr) {
        return std::nullopt;
    }

    const auto& maze = world.GetMaze();
    const GridPoint corner = maze.ScatterCorner(ai->type);

    if (ai->mode == GhostMode::Eaten) {
        return maze.GhostHouseTarget();
    }
    if (ai->mode == GhostMode::Frightened || IsGhostVulnerable(world, ghost)) {
        return std::nullopt;
    }
    if (ai->mode == GhostMode::Scatter) {
        return corner;
    }

    auto playerPos = GetPlayerPosition(world);
    if (!playerPos) {
        return corner;
    }
    const GridPoint player = playerPos->Cell();

    switch (ai->type) {
        case GhostType::Blinky:
            return player;

        case GhostType::Pinky:
            return ambushOffset(player, GetPlayerDirection(world), config_.pinkyLookAhead);

        case GhostType::Inky: {
            auto blinky = FindGhostByType(world, GhostType::Blinky);
            const auto* blinkyPos = blinky ? registry.Get<Position>(*blinky) : nullptr;
            if (blinkyPos == nullptr) {
                return player;
            }
            GridPoint pivot = player;
            if (auto dir = GetPlayerDirection(world)) {
                pivot = Step(player, *dir, config_.inkyLookAhead);
            }
            return GridPoint{2 * pivot.x - blinkyPos->gridX, 2 * pivot.y - blinkyPos->gridY};
        }

        case GhostType::Clyde: {
            const auto* pos = registry.Get<Position>(ghost);
            if (pos == nullptr) {
                return corner;
            }
            const double dist = std::sqrt(static_cast<double>(distanceSquared(pos->Cell(), player)));
            return dist > static_cast<double>(config_.clydeThreshold) ? player : corner;
        }
    }
    return corner;
}

// ═══════════════════════════════════════════════════════════════════════════
// Direction choice
// ═══════════════════════════════════════════════════════════════════════════

std::vector<Direction> GhostAISystem::availableDirections(const Maze& maze, GridPoint from,
                                                          std::optional<Direction> current) const {
    std::vector<Direction> available;
    for (auto dir : kAllDirections) {
        if (IsReverse(current, dir)) {
            continue;
        }
        auto next = Step(from, dir);
        if (maze.IsGhostWalkable(next.x, next.y)) {
            available.push_back(dir);
        }
    }
    return available;
}

std::optional<Direction> GhostAISystem::chooseTowardTarget(const Maze& maze, GridPoint from,
                                                           GridPoint target,
                                                           std::optional<Direction> current) const {
    auto available = availableDirections(maze, from, current);

    if (available.empty()) {
        if (current) {
            auto back = Step(from, Opposite(*current));
            if (maze.IsGhostWalkable(back.x, back.y)) {
                return Opposite(*current);
            }
        }
        return std::nullopt;
    }

    std::optional<Direction> best;
    int bestDist = std::numeric_limits<int>::max();
    for (auto dir : kTargetPriority) {
        if (std::find(available.begin(), available.end(), dir) == available.end()) {
            continue;
        }
        const int dist = distanceSquared(Step(from, dir), target);
        if (dist < bestDist) {
            bestDist = dist;
            best = dir;
        }
    }
    return best;
}

std::optional<Direction> GhostAISystem::chooseRandom(const Maze& maze, GridPoint from,
                                                     std::optional<Direction> current) {
    auto available = availableDirections(maze, from, current);
    if (available.empty()) {
        if (current) {
            return Opposite(*current);
        }
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> pick(0, available.size() - 1);
    return available[pick(rng_)];
}

// ═══════════════════════════════════════════════════════════════════════════
// Tick
// ═══════════════════════════════════════════════════════════════════════════

void GhostAISystem::Execute(World& world) {
    if (world.GetState() != GameState::Playing) {
        return;
    }

    for (Entity ghost : GetGhostEntities(world)) {
        updateGhost(world, ghost);
    }

    modeJustChanged_ = false;
}

void GhostAISystem::updateGhost(World& world, Entity ghost) {
    auto& registry = world.GetRegistry();
    auto* ai = registry.Get<GhostAI>(ghost);
    auto* velocity = registry.Get<Velocity>(ghost);
    const auto* position = registry.Get<Position>(ghost);
    if (ai == nullptr || velocity == nullptr || position == nullptr) {
        return;
    }

    const bool vulnerable = IsGhostVulnerable(world, ghost);
    const auto& maze = world.GetMaze();

    // ── Mode resolution ──
    GhostMode mode = globalMode_;
    if (eatenGhosts_.count(ghost) > 0) {
        mode = GhostMode::Eaten;
        const GridPoint home = maze.GhostHouseTarget();
        if (position->gridY == home.y &&
            (position->gridX == home.x || position->gridX == home.x + 1)) {
            eatenGhosts_.erase(ghost);
            mode = globalMode_;
            PACSIM_LOG_DEBUG(LogCategory::AI,
                             std::string(ToString(ai->type)) + " reached the ghost house");
        }
    } else if (vulnerable || frightenedActive_) {
        mode = GhostMode::Frightened;
    }

    if (mode != ai->mode) {
        PACSIM_LOG_TRACE(LogCategory::AI, std::string(ToString(ai->type)) + " mode " +
                                              std::string(ToString(ai->mode)) + " -> " +
                                              std::string(ToString(mode)));
        ai->mode = mode;
    }

    const float speed = vulnerable ? config_.frightenedSpeed : config_.ghostSpeed;

    if (modeJustChanged_ && velocity->direction) {
        velocity->direction = Opposite(*velocity->direction);
        velocity->speed = speed;
        return;
    }

    const bool aligned =
        MovementSystem::IsAligned(position->pixelX, position->pixelY, kPlanTolerance);
    if (velocity->direction && !aligned) {
        velocity->speed = speed;
        return;
    }

    const GridPoint from = position->Cell();
    std::optional<Direction> next;
    auto target = TargetFor(world, ghost);
    if (mode == GhostMode::Frightened || !target) {
        next = chooseRandom(maze, from, velocity->direction);
    } else {
        next = chooseTowardTarget(maze, from, *target, velocity->direction);
    }

    if (next && next != velocity->direction) {
        velocity->direction = next;
    }
    velocity->speed = speed;
}

} // namespace pacsim::game
