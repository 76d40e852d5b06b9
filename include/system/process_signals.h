// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file process_signals.h
 * @brief Show/exit/quit POSIX signals turned into flags for the main loop
 *
 * The handlers only set lock-free atomics; the controller polls them once per
 * loop iteration with take(), so no controller code ever runs in signal
 * context.
 *
 * | Signal                   | Flag   | Meaning                              |
 * |--------------------------|--------|--------------------------------------|
 * | SIGUSR1                  | show   | Bring the surface to the front       |
 * | SIGUSR2                  | exit   | Sanctioned exit (resolute --quit)    |
 * | SIGTERM, SIGINT, SIGHUP  | quit   | Process quit request (vetoed)        |
 */

#pragma once

namespace resolute {
namespace signals {

struct PendingSignals {
    bool show = false;
    bool exit = false;
    bool quit = false;

    bool any() const {
        return show || exit || quit;
    }
};

/// Install the handlers, saving the previous dispositions
void install();

/// Restore the saved dispositions
void uninstall();

bool is_installed();

/// Fetch and clear the pending flags
PendingSignals take();

} // namespace signals
} // namespace resolute
