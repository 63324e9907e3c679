/// @file game_loop.cpp
/// @brief GameLoop implementation.

#include "pacsim/app/game_loop.hpp"

namespace pacsim::app {

namespace {

constexpr uint32_t kDefaultTickRate = 60;

} // namespace

GameLoop::GameLoop(uint32_t tickRate)
    : tickRate_(tickRate > 0 ? tickRate : kDefaultTickRate),
      targetFrameTime_(std::chrono::microseconds(1'000'000 / tickRate_)) {}

GameLoop::~GameLoop() {
    stop();
}

void GameLoop::setTickCallback(TickCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    tickCallback_ = std::move(callback);
}

void GameLoop::setMetricsCallback(MetricsCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    metricsCallback_ = std::move(callback);
}

bool GameLoop::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    thread_ = std::thread([this] { run(); });
    return true;
}

void GameLoop::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void GameLoop::requestStop() noexcept {
    running_.store(false);
}

TickMetrics GameLoop::tick() {
    auto metrics = executeTick();
    {
        std::lock_guard<std::mutex> lock(metricsMutex_);
        lastMetrics_ = metrics;
    }
    return metrics;
}

bool GameLoop::isRunning() const noexcept {
    return running_.load();
}

uint32_t GameLoop::tickRate() const noexcept {
    return tickRate_;
}

std::chrono::microseconds GameLoop::targetFrameTime() const noexcept {
    return targetFrameTime_;
}

float GameLoop::frameDeltaMs() const noexcept {
    return static_cast<float>(targetFrameTime_.count()) / 1000.0f;
}

uint64_t GameLoop::tickCount() const noexcept {
    return tickCount_.load();
}

TickMetrics GameLoop::lastMetrics() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return lastMetrics_;
}

void GameLoop::run() {
    auto nextTick = std::chrono::steady_clock::now();

    while (running_.load()) {
        auto frameStart = std::chrono::steady_clock::now();
        nextTick += targetFrameTime_;

        auto metrics = executeTick();

        // Sleep until next tick, but skip if we already overran.
        auto now = std::chrono::steady_clock::now();
        if (now < nextTick) {
            std::this_thread::sleep_until(nextTick);
        } else {
            // Overrun: reset the target to avoid cascading catch-up.
            nextTick = now;
        }
        metrics.frameTime = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - frameStart);

        {
            std::lock_guard<std::mutex> lock(metricsMutex_);
            lastMetrics_ = metrics;
        }
        MetricsCallback onMetrics;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            onMetrics = metricsCallback_;
        }
        if (onMetrics) {
            onMetrics(metrics);
        }
    }
}

TickMetrics GameLoop::executeTick() {
    auto frameStart = std::chrono::steady_clock::now();

    // Invoked outside the lock so a callback may replace itself.
    TickCallback onTick;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        onTick = tickCallback_;
    }
    if (onTick) {
        onTick(frameDeltaMs());
    }

    auto updateDuration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - frameStart);

    TickMetrics metrics;
    metrics.updateTime = updateDuration;
    metrics.frameTime = updateDuration;  // For manual tick(), frame = update.
    metrics.budgetUtilization =
        targetFrameTime_.count() > 0
            ? static_cast<float>(updateDuration.count()) /
                  static_cast<float>(targetFrameTime_.count())
            : 0.0f;
    metrics.tickNumber = tickCount_.fetch_add(1);
    metrics.overrun = updateDuration > targetFrameTime_;
    return metrics;
}

} // namespace pacsim::app
