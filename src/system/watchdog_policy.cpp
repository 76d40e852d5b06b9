// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "watchdog_policy.h"

namespace resolute {

const char* watchdog_action_name(WatchdogAction action) {
    switch (action) {
    case WatchdogAction::Stop:
        return "Stop";
    case WatchdogAction::Attach:
        return "Attach";
    case WatchdogAction::Relaunch:
        return "Relaunch";
    }
    return "Invalid";
}

bool is_abnormal_death(const DeathObservation& death) {
    if (death.was_child) {
        return death.signaled || death.exit_code != 0;
    }
    return death.marker_present;
}

WatchdogAction next_action(bool abnormal, bool instance_running) {
    if (instance_running) {
        return WatchdogAction::Attach;
    }
    return abnormal ? WatchdogAction::Relaunch : WatchdogAction::Stop;
}

} // namespace resolute
