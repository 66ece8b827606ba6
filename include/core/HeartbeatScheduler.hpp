/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HEARTBEAT_SCHEDULER_HPP
#define HEARTBEAT_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace Tessera {

/**
 * HeartbeatScheduler drives the world's fixed-period heartbeat.
 *
 * A dedicated thread invokes the tick handler once per period. The first tick
 * is phase-aligned to the next wall-clock multiple of the period (e.g. the
 * next full 500 ms), later deadlines advance by exactly one period on the
 * steady clock so the cadence does not drift. Ticks never overlap: when a
 * handler runs past one or more deadlines those boundaries are skipped and
 * counted as overruns.
 *
 * Exceptions escaping the handler are logged and counted; the heartbeat keeps
 * running.
 */
class HeartbeatScheduler {
public:
    enum class State : uint8_t {
        Uninitialized = 0,  // Constructed, start() not called yet
        Scheduled = 1,      // Thread running, first tick pending
        Ticking = 2,        // At least one tick fired
        Stopped = 3         // Terminal
    };

    using TickHandler = std::function<void(uint64_t tickNumber)>;

    static constexpr std::chrono::milliseconds DEFAULT_PERIOD{500};
    static constexpr std::chrono::milliseconds DEFAULT_SLOW_TICK_THRESHOLD{250};

    /**
     * @param period Time between ticks
     * @param alignToWallClock Align the first tick to a wall-clock multiple of @p period
     * @throws std::invalid_argument if @p period is not positive
     */
    explicit HeartbeatScheduler(std::chrono::milliseconds period = DEFAULT_PERIOD,
                                bool alignToWallClock = true);

    /**
     * Stops and joins the heartbeat thread if it is still running
     */
    ~HeartbeatScheduler();

    /**
     * Start the heartbeat. Can only be called once per scheduler.
     * @param handler Invoked on the heartbeat thread with a 1-based tick number
     * @return false if already started/stopped or @p handler is empty
     */
    bool start(TickHandler handler);

    /**
     * Stop the heartbeat and wait for an in-flight tick to finish.
     * Idempotent. When called from inside the handler the thread exits after
     * the current tick instead of being joined.
     */
    void stop();

    State getState() const { return m_state.load(std::memory_order_acquire); }
    bool isRunning() const;

    std::chrono::milliseconds getPeriod() const { return m_period; }
    bool isAlignedToWallClock() const { return m_alignToWallClock; }

    void setSlowTickThreshold(std::chrono::milliseconds threshold);

    uint64_t getTickCount() const { return m_tickCount.load(std::memory_order_acquire); }
    uint64_t getFaultCount() const { return m_faultCount.load(std::memory_order_relaxed); }
    uint64_t getOverrunCount() const { return m_overrunCount.load(std::memory_order_relaxed); }
    std::chrono::microseconds getLastTickDuration() const {
        return std::chrono::microseconds(m_lastTickMicros.load(std::memory_order_relaxed));
    }

    /**
     * Delay from @p now until the next wall-clock multiple of @p period.
     * A time already on a boundary waits a full period.
     */
    static std::chrono::milliseconds initialDelay(std::chrono::system_clock::time_point now,
                                                  std::chrono::milliseconds period);

private:
    void run(std::chrono::steady_clock::time_point firstDeadline);
    void fire(uint64_t tickNumber);

    const std::chrono::milliseconds m_period;
    const bool m_alignToWallClock;
    std::atomic<int64_t> m_slowTickThresholdMs{DEFAULT_SLOW_TICK_THRESHOLD.count()};

    TickHandler m_handler;
    std::thread m_thread;

    std::atomic<State> m_state{State::Uninitialized};

    // Wakes the heartbeat thread early on stop()
    std::mutex m_wakeMutex;
    std::condition_variable m_wakeCondition;
    bool m_stopRequested{false};

    std::mutex m_joinMutex;

    std::atomic<uint64_t> m_tickCount{0};
    std::atomic<uint64_t> m_faultCount{0};
    std::atomic<uint64_t> m_overrunCount{0};
    std::atomic<int64_t> m_lastTickMicros{0};

    HeartbeatScheduler(const HeartbeatScheduler&) = delete;
    HeartbeatScheduler& operator=(const HeartbeatScheduler&) = delete;
};

} // namespace Tessera

#endif // HEARTBEAT_SCHEDULER_HPP
