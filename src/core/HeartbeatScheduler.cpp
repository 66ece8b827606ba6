/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/HeartbeatScheduler.hpp"
#include "core/Logger.hpp"
#include <exception>
#include <stdexcept>
#include <string>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace Tessera {

HeartbeatScheduler::HeartbeatScheduler(std::chrono::milliseconds period, bool alignToWallClock)
    : m_period(period)
    , m_alignToWallClock(alignToWallClock)
{
    if (m_period.count() <= 0) {
        throw std::invalid_argument("Heartbeat period must be positive: " +
                                    std::to_string(m_period.count()) + "ms");
    }
}

HeartbeatScheduler::~HeartbeatScheduler() {
    stop();
    if (m_thread.joinable()) {
        // Only reachable when the scheduler is destroyed from its own handler
        m_thread.detach();
    }
}

std::chrono::milliseconds HeartbeatScheduler::initialDelay(std::chrono::system_clock::time_point now,
                                                           std::chrono::milliseconds period) {
    auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
    return period - (sinceEpoch % period);
}

bool HeartbeatScheduler::start(TickHandler handler) {
    if (!handler) {
        HEARTBEAT_ERROR("Cannot start heartbeat without a tick handler");
        return false;
    }

    State expected = State::Uninitialized;
    if (!m_state.compare_exchange_strong(expected, State::Scheduled, std::memory_order_acq_rel)) {
        HEARTBEAT_WARN("Heartbeat already started");
        return false;
    }

    m_handler = std::move(handler);

    auto delay = m_alignToWallClock
                     ? initialDelay(std::chrono::system_clock::now(), m_period)
                     : m_period;
    auto firstDeadline = std::chrono::steady_clock::now() + delay;

    try {
        m_thread = std::thread(&HeartbeatScheduler::run, this, firstDeadline);
    } catch (const std::exception& e) {
        HEARTBEAT_CRITICAL("Failed to start heartbeat thread: " + std::string(e.what()));
        m_state.store(State::Stopped, std::memory_order_release);
        return false;
    }

    HEARTBEAT_INFO("Heartbeat scheduled every " + std::to_string(m_period.count()) +
                   "ms, first tick in " + std::to_string(delay.count()) + "ms");
    return true;
}

void HeartbeatScheduler::stop() {
    bool firstRequest = false;
    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        firstRequest = !m_stopRequested;
        m_stopRequested = true;
    }
    if (firstRequest) {
        m_wakeCondition.notify_all();
    }

    // A stop requested from inside the handler still needs the join here
    {
        std::lock_guard<std::mutex> joinLock(m_joinMutex);
        if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
            m_thread.join();
        }
    }

    if (firstRequest) {
        m_state.store(State::Stopped, std::memory_order_release);
        HEARTBEAT_INFO("Heartbeat stopped after " + std::to_string(getTickCount()) + " ticks");
    }
}

bool HeartbeatScheduler::isRunning() const {
    State state = getState();
    return state == State::Scheduled || state == State::Ticking;
}

void HeartbeatScheduler::setSlowTickThreshold(std::chrono::milliseconds threshold) {
    m_slowTickThresholdMs.store(threshold.count(), std::memory_order_relaxed);
}

void HeartbeatScheduler::run(std::chrono::steady_clock::time_point firstDeadline) {
#if defined(__linux__)
    pthread_setname_np(pthread_self(), "Heartbeat");
#endif

    auto deadline = firstDeadline;
    uint64_t tickNumber = 0;

    std::unique_lock<std::mutex> lock(m_wakeMutex);
    while (!m_wakeCondition.wait_until(lock, deadline, [this] { return m_stopRequested; })) {
        lock.unlock();

        if (tickNumber == 0) {
            m_state.store(State::Ticking, std::memory_order_release);
        }
        fire(++tickNumber);

        deadline += m_period;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            // Skip boundaries the last tick ran through instead of firing back-to-back
            auto missed = (now - deadline) / m_period + 1;
            deadline += m_period * missed;
            m_overrunCount.fetch_add(static_cast<uint64_t>(missed), std::memory_order_relaxed);
            HEARTBEAT_WARN("Tick " + std::to_string(tickNumber) + " overran, skipped " +
                           std::to_string(missed) + " heartbeat(s)");
        }

        lock.lock();
    }
}

void HeartbeatScheduler::fire(uint64_t tickNumber) {
    auto tickStart = std::chrono::steady_clock::now();

    try {
        m_handler(tickNumber);
    } catch (const std::exception& e) {
        m_faultCount.fetch_add(1, std::memory_order_relaxed);
        HEARTBEAT_ERROR("Exception in tick " + std::to_string(tickNumber) + ": " + std::string(e.what()));
    } catch (...) {
        m_faultCount.fetch_add(1, std::memory_order_relaxed);
        HEARTBEAT_ERROR("Unknown exception in tick " + std::to_string(tickNumber));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - tickStart);
    m_lastTickMicros.store(elapsed.count(), std::memory_order_relaxed);
    m_tickCount.fetch_add(1, std::memory_order_release);

    if (elapsed > std::chrono::milliseconds(m_slowTickThresholdMs.load(std::memory_order_relaxed))) {
        HEARTBEAT_WARN("Slow tick " + std::to_string(tickNumber) + ": " +
                       std::to_string(elapsed.count() / 1000) + "ms");
    }
}

} // namespace Tessera
