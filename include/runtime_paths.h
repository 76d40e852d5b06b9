// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace resolute {

/**
 * @brief Directories used by one Resolute installation
 *
 * Resolved once at process entry from the XDG base-directory variables with
 * HOME fallbacks. When RESOLUTE_HOME is set, every directory lives below it
 * (config/, state/, run/, data/), which keeps tests and portable installs
 * isolated from the user's real state.
 */
struct RuntimePaths {
    std::string config_dir;  ///< Config file location ($XDG_CONFIG_HOME/resolute)
    std::string state_dir;   ///< Liveness marker and crash report ($XDG_STATE_HOME/resolute)
    std::string runtime_dir; ///< Instance and watchdog locks ($XDG_RUNTIME_DIR/resolute)
    std::string data_dir;    ///< Rotating log file ($XDG_DATA_HOME/resolute)

    /**
     * @brief Resolve all directories from the current environment
     */
    static RuntimePaths resolve();

    /**
     * @brief Build a layout rooted at a single directory
     */
    static RuntimePaths under(const std::string& root);

    std::string config_file() const {
        return config_dir + "/resolute.json";
    }
    std::string instance_lock_file() const {
        return runtime_dir + "/instance.lock";
    }
    std::string watchdog_lock_file() const {
        return runtime_dir + "/watchdog.lock";
    }
    std::string crash_file() const {
        return state_dir + "/crash.txt";
    }
    std::string log_file() const {
        return data_dir + "/resolute.log";
    }

    /**
     * @brief Create every directory that does not exist yet (mode 0700)
     * @return false if any directory could not be created
     */
    bool ensure_directories() const;
};

} // namespace resolute
