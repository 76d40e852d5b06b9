// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file app_constants.h
 * @brief Centralized application constants shared by the controller, the
 *        watchdog and the worker launcher
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace resolute {

/**
 * @brief Application-wide constants
 */
namespace AppConstants {

/// Environment flag set on every supervisor-triggered (re)launch
constexpr const char* SUPERVISED_ENV = "RESOLUTE_SUPERVISED";

/// Overrides every XDG directory (used by tests and portable installs)
constexpr const char* HOME_OVERRIDE_ENV = "RESOLUTE_HOME";

/// Worker executable name, looked up beside the main executable
constexpr const char* WORKER_BINARY = "resolute-worker";

/// Watchdog executable name, looked up beside the main executable
constexpr const char* WATCHDOG_BINARY = "resolute-watchdog";

/**
 * @brief Process exit codes consumed by the supervisor
 */
namespace ExitCode {
/// Sanctioned exit: the supervisor must not relaunch
constexpr int CLEAN = 0;
/// Anything else: the supervisor should relaunch
constexpr int ABNORMAL = 1;
} // namespace ExitCode

/**
 * @brief Main loop timing
 */
namespace Loop {
/// One frame (~60 FPS)
constexpr uint32_t FRAME_DELAY_MS = 16;
} // namespace Loop

/**
 * @brief Window lifecycle defaults (overridable from config)
 */
namespace Lifecycle {
/// Delay before a vetoed close/quit brings the surface back
constexpr uint32_t CLOSE_RESHOW_DELAY_MS = 2000;
/// Delay before an unexpectedly destroyed surface is re-created
constexpr uint32_t RECREATE_DELAY_MS = 1000;
/// Accepted range for both delays in config
constexpr uint32_t MIN_DELAY_MS = 100;
constexpr uint32_t MAX_DELAY_MS = 60000;
} // namespace Lifecycle

/**
 * @brief Restart throttling
 */
namespace Restart {
/// Supervisor delay between an observed death and the relaunch
constexpr int SUPERVISOR_DELAY_SEC = 5;
constexpr int MIN_SUPERVISOR_DELAY_SEC = 1;
constexpr int MAX_SUPERVISOR_DELAY_SEC = 3600;
/// Self-relaunch delay after a controller fault
constexpr uint32_t SELF_RELAUNCH_DELAY_MS = 1000;
/// Lower bound for the self-relaunch delay
constexpr uint32_t MIN_SELF_RELAUNCH_DELAY_MS = 1000;
/// Upper bound for the self-relaunch delay
constexpr uint32_t MAX_SELF_RELAUNCH_DELAY_MS = 60000;
/// Watchdog poll interval while attached to a process it did not launch
constexpr uint32_t ATTACH_POLL_INTERVAL_MS = 500;
} // namespace Restart

/**
 * @brief Background task executor
 */
namespace Task {
/// Grace period between SIGTERM and SIGKILL in terminate()
constexpr int TERMINATE_GRACE_MS = 2000;
/// poll() timeout used by the output reader thread
constexpr int READER_POLL_MS = 100;
/// Longest output line delivered in one piece; longer lines arrive split
constexpr size_t MAX_LINE_BYTES = 64 * 1024;
} // namespace Task

/**
 * @brief Default window geometry
 */
namespace Display {
constexpr int DEFAULT_WIDTH = 800;
constexpr int DEFAULT_HEIGHT = 600;
} // namespace Display

} // namespace AppConstants

} // namespace resolute
