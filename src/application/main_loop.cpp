// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "main_loop.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <vector>

namespace resolute {

namespace {

uint64_t monotonic_ms() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

} // namespace

MainLoop::MainLoop(TickSource ticks) : ticks_(ticks ? std::move(ticks) : monotonic_ms) {}

uint64_t MainLoop::now() const {
    return ticks_();
}

void MainLoop::post(Callback fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    posted_.push(std::move(fn));
}

MainLoop::TimerId MainLoop::schedule(uint32_t delay_ms, Callback fn) {
    TimerId id = next_timer_id_++;
    timers_.emplace(id, Timer{now() + delay_ms, std::move(fn)});
    return id;
}

bool MainLoop::cancel(TimerId id) {
    return timers_.erase(id) != 0;
}

void MainLoop::cancel_all() {
    timers_.clear();
}

void MainLoop::run_once() {
    run_once(now());
}

void MainLoop::run_once(uint64_t now_ms) {
    drain_posted();
    fire_due_timers(now_ms);
}

void MainLoop::invoke(const Callback& fn) {
    if (!fault_handler_) {
        fn();
        return;
    }
    try {
        fn();
    } catch (const std::exception& e) {
        fault_handler_(e.what());
    } catch (...) {
        fault_handler_("non-standard exception");
    }
}

void MainLoop::drain_posted() {
    // Move pending callbacks out to minimize lock time
    std::queue<Callback> to_process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(to_process, posted_);
    }

    while (!to_process.empty()) {
        invoke(to_process.front());
        to_process.pop();
    }
}

void MainLoop::fire_due_timers(uint64_t now_ms) {
    std::vector<std::pair<uint64_t, TimerId>> due;
    for (const auto& [id, timer] : timers_) {
        if (timer.due_ms <= now_ms) {
            due.emplace_back(timer.due_ms, id);
        }
    }
    std::sort(due.begin(), due.end());

    for (const auto& entry : due) {
        // An earlier callback may have cancelled this one
        auto it = timers_.find(entry.second);
        if (it == timers_.end()) {
            continue;
        }
        Callback fn = std::move(it->second.fn);
        timers_.erase(it);
        invoke(fn);
    }
}

} // namespace resolute
