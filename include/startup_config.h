// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace resolute {

class LivenessMarker;
struct CliArgs;

/**
 * @brief What the window looks like right after startup
 */
enum class InitialSurface { Visible, Headless };

const char* initial_surface_name(InitialSurface surface);

/**
 * @brief Facts about this launch, captured once at process entry
 *
 * Built before any component and handed down by const reference. Nothing
 * reads the environment or the marker for these facts again later.
 */
struct StartupConfig {
    bool launched_by_supervisor = false; ///< RESOLUTE_SUPERVISED was truthy
    bool previous_run_unclean = false;   ///< Liveness marker existed at startup
    std::optional<std::time_t> marker_written_at;

    std::string executable_path;             ///< For relaunching ourselves
    std::vector<std::string> relaunch_args;  ///< argv[1..] to pass on relaunch

    bool force_headless = false;
    bool force_show = false;
    bool run_task_at_startup = false;

    /**
     * @brief Initial surface state
     *
     * CLI overrides win. Otherwise a supervisor relaunch stays headless
     * unless the previous run died uncleanly; a user launch is visible.
     */
    InitialSurface initial_surface() const;

    /**
     * @brief Capture the launch facts
     *
     * @param argc/argv Process arguments (argv[0] is the executable fallback)
     * @param args Parsed CLI options
     * @param marker Marker to inspect (read once here)
     */
    static StartupConfig capture(int argc, char** argv, const CliArgs& args,
                                 const LivenessMarker& marker);
};

/**
 * @brief Interpret an environment flag value ("1", "true", "yes", "on")
 */
bool parse_env_flag(const char* value);

/**
 * @brief Absolute path of the running executable
 *
 * /proc/self/exe on Linux, argv[0] resolved against the cwd elsewhere.
 */
std::string current_executable_path(const char* argv0);

} // namespace resolute
