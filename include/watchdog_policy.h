// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file watchdog_policy.h
 * @brief Relaunch decisions made by resolute-watchdog
 *
 * The watchdog supervises either a process it launched itself (exit status
 * known) or a process it attached to (only the liveness marker tells how it
 * ended). Kept free of I/O so the rules are unit tested.
 */

#pragma once

namespace resolute {

/**
 * @brief What the watchdog learned about a death
 */
struct DeathObservation {
    bool was_child = false; ///< Launched by the watchdog; exit status is valid
    bool signaled = false;
    int exit_code = 0;
    int signal = 0;
    bool marker_present = false; ///< Liveness marker still on disk after the death
};

enum class WatchdogAction {
    Stop,     ///< Clean exit: stop supervising
    Attach,   ///< Another primary holds the instance lock: watch it instead
    Relaunch, ///< Start the executable again
};

const char* watchdog_action_name(WatchdogAction action);

/**
 * @brief Abnormal = non-zero exit or signal for a child, marker left behind otherwise
 */
bool is_abnormal_death(const DeathObservation& death);

/**
 * @brief Next step once a death has been judged
 *
 * For abnormal deaths the caller asks again after the restart delay, so a
 * primary that relaunched itself in the meantime is attached rather than
 * duplicated.
 */
WatchdogAction next_action(bool abnormal, bool instance_running);

} // namespace resolute
