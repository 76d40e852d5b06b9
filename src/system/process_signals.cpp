// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system/process_signals.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>

namespace resolute {
namespace signals {

namespace {

std::atomic<bool> s_show{false};
std::atomic<bool> s_exit{false};
std::atomic<bool> s_quit{false};
bool s_installed = false;

constexpr int HANDLED_SIGNALS[] = {SIGUSR1, SIGUSR2, SIGTERM, SIGINT, SIGHUP};
constexpr int NUM_HANDLED = sizeof(HANDLED_SIGNALS) / sizeof(HANDLED_SIGNALS[0]);

struct sigaction s_old_actions[NUM_HANDLED];

static_assert(std::atomic<bool>::is_always_lock_free, "signal flags must be lock-free");

void flag_handler(int sig) {
    switch (sig) {
    case SIGUSR1:
        s_show.store(true);
        break;
    case SIGUSR2:
        s_exit.store(true);
        break;
    default:
        s_quit.store(true);
        break;
    }
}

} // namespace

void install() {
    if (s_installed) {
        spdlog::debug("[Signals] Already installed");
        return;
    }

    s_show.store(false);
    s_exit.store(false);
    s_quit.store(false);

    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = flag_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    for (int i = 0; i < NUM_HANDLED; ++i) {
        if (sigaction(HANDLED_SIGNALS[i], &sa, &s_old_actions[i]) != 0) {
            spdlog::warn("[Signals] sigaction({}) failed: {}", HANDLED_SIGNALS[i],
                         strerror(errno));
        }
    }

    s_installed = true;
    spdlog::debug("[Signals] Installed show/exit/quit handlers");
}

void uninstall() {
    if (!s_installed) {
        return;
    }
    for (int i = 0; i < NUM_HANDLED; ++i) {
        sigaction(HANDLED_SIGNALS[i], &s_old_actions[i], nullptr);
    }
    s_installed = false;
    spdlog::debug("[Signals] Restored previous handlers");
}

bool is_installed() {
    return s_installed;
}

PendingSignals take() {
    PendingSignals pending;
    pending.show = s_show.exchange(false);
    pending.exit = s_exit.exchange(false);
    pending.quit = s_quit.exchange(false);
    return pending;
}

} // namespace signals
} // namespace resolute
