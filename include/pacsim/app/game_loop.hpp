#pragma once

/// @file game_loop.hpp
/// @brief Fixed-rate frame driver with frame timing and metrics.
///
/// GameLoop runs a tick callback at a configurable rate (default 60 Hz,
/// about 16.67 ms per tick) either on a dedicated thread or one tick at
/// a time through tick().  Each tick measures the callback's run time
/// and flags overruns (ticks slower than the target frame time).

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace pacsim::app {

/// Per-tick performance metrics.
struct TickMetrics {
    /// Time spent in the tick callback.
    std::chrono::microseconds updateTime{0};

    /// Total frame time including sleep.
    std::chrono::microseconds frameTime{0};

    /// Ratio of updateTime to the target frame time (1.0 = full budget).
    float budgetUtilization = 0.0f;

    /// Tick counter, starting at 0.
    uint64_t tickNumber = 0;

    bool overrun = false;
};

/// Fixed-rate frame driver.
///
/// The simulation must only be touched from the thread that runs the
/// ticks: the loop thread after start(), or the caller of tick().
///
/// Usage:
/// @code
///   GameLoop loop(60);
///   loop.setTickCallback([&](float deltaMs) { controller.Update(deltaMs); });
///   if (!loop.start()) { ... }
///   // ...
///   loop.stop();
/// @endcode
class GameLoop {
public:
    using TickCallback = std::function<void(float deltaMs)>;
    using MetricsCallback = std::function<void(const TickMetrics&)>;

    /// @param tickRate  Ticks per second; 0 selects the default of 60.
    explicit GameLoop(uint32_t tickRate = 60);

    ~GameLoop();

    // Non-copyable, non-movable (owns a thread).
    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;
    GameLoop(GameLoop&&) = delete;
    GameLoop& operator=(GameLoop&&) = delete;

    /// Set the callback invoked each tick with the frame delta in milliseconds.
    /// Takes effect from the next tick; safe to call from inside a callback.
    void setTickCallback(TickCallback callback);

    void setMetricsCallback(MetricsCallback callback);

    /// Start ticking on a dedicated thread.
    /// @return false if already running.
    [[nodiscard]] bool start();

    /// Stop the loop and join its thread.  Must not be called from a
    /// tick callback; use requestStop() there.
    void stop();

    /// Ask the loop to finish after the current tick.  Safe from callbacks.
    void requestStop() noexcept;

    /// Execute a single tick on the calling thread.
    ///
    /// The loop must not be running on its own thread.
    TickMetrics tick();

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] uint32_t tickRate() const noexcept;
    [[nodiscard]] std::chrono::microseconds targetFrameTime() const noexcept;

    /// Delta passed to the tick callback, in milliseconds.
    [[nodiscard]] float frameDeltaMs() const noexcept;

    [[nodiscard]] uint64_t tickCount() const noexcept;
    [[nodiscard]] TickMetrics lastMetrics() const;

private:
    void run();
    TickMetrics executeTick();

    uint32_t tickRate_;
    std::chrono::microseconds targetFrameTime_;

    TickCallback tickCallback_;
    MetricsCallback metricsCallback_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tickCount_{0};
    std::thread thread_;

    mutable std::mutex metricsMutex_;
    TickMetrics lastMetrics_;

    mutable std::mutex callbackMutex_;
};

} // namespace pacsim::app
