// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file crash_handler.h
 * @brief Fatal-signal handler: crash report plus detached self-relaunch
 *
 * On SIGSEGV, SIGABRT, SIGBUS or SIGFPE the handler writes a key:value crash
 * file using only async-signal-safe calls, optionally starts a delayed
 * relaunch of the executable from a pre-built ExecImage, then re-raises the
 * signal so the process still dies with an abnormal status.
 *
 * The next run reads the file with read_crash_file() and removes it.
 *
 * Crash file format:
 * @code
 * signal:11
 * name:SIGSEGV
 * version:0.4.0
 * timestamp:1707350400
 * uptime:3600
 * fault_addr:0x0
 * bt:0x0040abcd
 * @endcode
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace resolute {

class ExecImage;

namespace crash_handler {

/**
 * @brief Install the fatal-signal handlers
 *
 * @param crash_file_path Where the report is written (copied into a static buffer)
 * @param relaunch Image to exec after relaunch_delay_ms, or nullptr for none.
 *                 Must stay alive until uninstall().
 * @param relaunch_delay_ms Delay before the relaunched image starts
 */
void install(const std::string& crash_file_path, const ExecImage* relaunch = nullptr,
             unsigned relaunch_delay_ms = 1000);

/// Restore the previous handlers
void uninstall();

bool is_installed();

bool has_crash_file(const std::string& crash_file_path);

/**
 * @brief Parse a crash file into JSON
 * @return null JSON if missing or lacking signal/name
 */
nlohmann::json read_crash_file(const std::string& crash_file_path);

void remove_crash_file(const std::string& crash_file_path);

} // namespace crash_handler
} // namespace resolute
