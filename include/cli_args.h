// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for resolute
 */

#include <string>

namespace resolute {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path; ///< -c/--config (empty = default location)

    // Initial surface overrides
    bool force_headless = false; ///< --headless
    bool force_show = false;     ///< --show

    // Actions
    bool forward_quit = false;         ///< --quit: ask the running instance to exit
    bool run_task = false;             ///< --run-task: start the worker right away
    bool no_supervisor = false;        ///< --no-supervisor
    bool uninstall_supervisor = false; ///< --uninstall-supervisor

    std::string backend; ///< --backend sdl|mock|auto (empty = config)

    // Logging
    int verbosity = 0;        ///< -v count
    std::string log_dest;     ///< --log-dest (empty = config)
    std::string log_file;     ///< --log-file

    /// Exit code to use when parse_cli_args() returns false
    int exit_code = 0;
};

/**
 * @brief Parse argv into args
 *
 * @return false when the process should exit right away (help, version or a
 *         usage error); args.exit_code holds the code to exit with
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

void print_usage(const char* program);

} // namespace resolute
