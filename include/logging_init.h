// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file logging_init.h
 * @brief spdlog setup shared by resolute and resolute-watchdog
 *
 * Every process logs to the console plus at most one system sink
 * (journal, syslog or a rotating file). Component prefixes go in the
 * message itself: spdlog::info("[Controller] ...").
 */

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace resolute {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog on Linux, else console only
    Journal, ///< systemd journal (requires RESOLUTE_HAS_SYSTEMD)
    Syslog,  ///< syslog(3)
    File,    ///< Rotating file, 5MB x 3
    Console  ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< Used for LogTarget::File; empty = default location
    std::string ident = "resolute";
};

/**
 * @brief Install the default logger built from the config
 *
 * Safe to call more than once; the previous default logger is replaced.
 */
void init(const LogConfig& config);

/**
 * @brief Parse a --log-dest / log_dest value ("auto", "journal", ...)
 * @return LogTarget::Auto for unknown values
 */
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Parse a level name ("trace" ... "off", "warning" accepted)
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/**
 * @brief Map -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief CLI verbosity wins over the config level, which wins over warn
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

} // namespace logging
} // namespace resolute
