// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file main_loop.h
 * @brief Single-threaded cooperative loop: posted callbacks and timers
 *
 * The controller owns one MainLoop and calls run_once() every frame. Other
 * threads (the task executor's reader) hand work to the loop with post(),
 * which is the only thread-safe entry point:
 *
 * @code
 * // From the reader thread:
 * loop.post([this, line] { on_task_output(line); });
 *
 * // From the loop thread:
 * auto id = loop.schedule(2000, [this] { reshow(); });
 * loop.cancel(id);
 * @endcode
 *
 * Time comes from an injectable millisecond tick source so tests can drive
 * timers with run_once(now_ms) instead of sleeping.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <string>

namespace resolute {

class MainLoop {
  public:
    using Callback = std::function<void()>;
    using TimerId = uint64_t;
    using TickSource = std::function<uint64_t()>;
    using FaultHandler = std::function<void(const std::string&)>;

    static constexpr TimerId INVALID_TIMER = 0;

    /**
     * @param ticks Millisecond clock; defaults to a monotonic clock
     */
    explicit MainLoop(TickSource ticks = nullptr);

    MainLoop(const MainLoop&) = delete;
    MainLoop& operator=(const MainLoop&) = delete;

    /**
     * @brief Queue a callback for the next iteration
     *
     * Thread-safe. Can be called from any thread.
     */
    void post(Callback fn);

    /**
     * @brief Run fn once, delay_ms after now()
     */
    TimerId schedule(uint32_t delay_ms, Callback fn);

    /**
     * @brief Cancel a pending timer
     * @return true if the timer was pending
     */
    bool cancel(TimerId id);

    void cancel_all();

    bool is_pending(TimerId id) const {
        return timers_.count(id) != 0;
    }

    size_t pending_timers() const {
        return timers_.size();
    }

    /**
     * @brief Where exceptions escaping callbacks go
     *
     * Without a handler the exception propagates out of run_once().
     */
    void set_fault_handler(FaultHandler handler) {
        fault_handler_ = std::move(handler);
    }

    /**
     * @brief One iteration: drain posted callbacks, then fire due timers
     */
    void run_once();
    void run_once(uint64_t now_ms);

    /// Run posted callbacks only, leaving timers alone
    void drain_posted();

    uint64_t now() const;

  private:
    struct Timer {
        uint64_t due_ms;
        Callback fn;
    };

    void invoke(const Callback& fn);
    void fire_due_timers(uint64_t now_ms);

    TickSource ticks_;
    FaultHandler fault_handler_;

    std::mutex mutex_;
    std::queue<Callback> posted_;

    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;
};

} // namespace resolute
