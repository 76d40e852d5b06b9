// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "main_loop.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace resolute;

class MainLoopFixture {
  protected:
    MainLoopFixture() : loop([this]() { return tick; }) {}

    void advance(uint64_t ms) {
        tick += ms;
        loop.run_once(tick);
    }

    uint64_t tick = 1000;
    MainLoop loop;
};

// ============================================================================
// Posted callbacks
// ============================================================================

TEST_CASE_METHOD(MainLoopFixture, "MainLoop: posted callbacks run in order", "[core][loop]") {
    std::vector<int> order;
    loop.post([&]() { order.push_back(1); });
    loop.post([&]() { order.push_back(2); });
    loop.post([&]() { order.push_back(3); });

    REQUIRE(order.empty());
    loop.run_once(tick);
    REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE_METHOD(MainLoopFixture, "MainLoop: callbacks posted while draining wait a turn",
                 "[loop]") {
    int runs = 0;
    loop.post([&]() {
        runs++;
        loop.post([&]() { runs++; });
    });

    loop.run_once(tick);
    REQUIRE(runs == 1);
    loop.run_once(tick);
    REQUIRE(runs == 2);
}

TEST_CASE_METHOD(MainLoopFixture, "MainLoop: post is safe from other threads", "[loop]") {
    std::atomic<int> posted{0};
    int ran = 0;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 250; ++i) {
                loop.post([&]() { ran++; });
                posted++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    loop.run_once(tick);
    REQUIRE(posted == 1000);
    REQUIRE(ran == 1000);
}

// ============================================================================
// Timers
// ============================================================================

TEST_CASE_METHOD(MainLoopFixture, "MainLoop: timer fires once when due", "[core][loop][timer]") {
    int fired = 0;
    auto id = loop.schedule(500, [&]() { fired++; });
    REQUIRE(loop.is_pending(id));

    advance(499);
    REQUIRE(fired == 0);

    advance(1);
    REQUIRE(fired == 1);
    REQUIRE_FALSE(loop.is_pending(id));

    advance(10000);
    REQUIRE(fired == 1);
}

TEST_CASE_METHOD(MainLoopFixture, "MainLoop: due timers fire in due order", "[loop][timer]") {
    std::vector<std::string> order;
    loop.schedule(300, [&]() { order.push_back("late"); });
    loop.schedule(100, [&]() { order.push_back("early"); });
    loop.schedule(100, [&]() { order.push_back("early-second"); });

    advance(1000);
    REQUIRE(order == std::vector<std::string>{"early", "early-second", "late"});
}

TEST_CASE_METHOD(MainLoopFixture, "MainLoop: cancelled timer never fires", "[core][loop][timer]") {
    int fired = 0;
    auto id = loop.schedule(100, [&]() { fired++; });

    REQUIRE(loop.cancel(id));
    REQUIRE_FALSE(loop.cancel(id));
    advance(1000);
    REQUIRE(fired == 0);
}

TEST_CASE_METHOD(MainLoopFixture, "MainLoop: a timer may cancel a later one", "[loop][timer]") {
    int fired = 0;
    MainLoop::TimerId second = MainLoop::INVALID_TIMER;
    loop.schedule(100, [&]() { loop.cancel(second); });
    second = loop.schedule(200, [&]() { fired++; });

    advance(1000);
    REQUIRE(fired == 0);
    REQUIRE(loop.pending_timers() == 0);
}

TEST_CASE_METHOD(MainLoopFixture, "MainLoop: cancel_all clears everything", "[loop][timer]") {
    loop.schedule(100, []() {});
    loop.schedule(200, []() {});
    REQUIRE(loop.pending_timers() == 2);

    loop.cancel_all();
    REQUIRE(loop.pending_timers() == 0);
}

// ============================================================================
// Faults
// ============================================================================

TEST_CASE_METHOD(MainLoopFixture, "MainLoop: callback exceptions go to the fault handler",
                 "[core][loop][fault]") {
    std::vector<std::string> faults;
    loop.set_fault_handler([&](const std::string& reason) { faults.push_back(reason); });

    int after = 0;
    loop.post([]() { throw std::runtime_error("boom"); });
    loop.post([&]() { after++; });
    loop.schedule(10, []() { throw 42; });

    advance(100);
    REQUIRE(faults == std::vector<std::string>{"boom", "non-standard exception"});
    REQUIRE(after == 1);
}

TEST_CASE_METHOD(MainLoopFixture, "MainLoop: without a handler exceptions propagate",
                 "[loop][fault]") {
    loop.post([]() { throw std::runtime_error("boom"); });
    REQUIRE_THROWS_AS(loop.run_once(tick), std::runtime_error);
}
