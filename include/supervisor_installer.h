// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace resolute {

class Config;
struct RuntimePaths;

/**
 * @brief Registers the executable with something that relaunches it after
 *        an abnormal exit
 *
 * Implementations:
 * - WatchdogSupervisorInstaller: detached resolute-watchdog process
 * - NullSupervisorInstaller: no supervision (--no-supervisor, or disabled in config)
 *
 * install() is idempotent and best-effort: failures are logged and reported
 * through the return value, never thrown.
 */
class SupervisorInstaller {
  public:
    virtual ~SupervisorInstaller() = default;

    /**
     * @param executable_path What to relaunch
     * @param args Arguments for the relaunched process
     * @return true if supervision is in place afterwards
     */
    virtual bool install(const std::string& executable_path,
                         const std::vector<std::string>& args) = 0;

    /**
     * @brief Stop supervising
     * @return true if no supervisor is left running
     */
    virtual bool uninstall() = 0;

    virtual bool is_installed() const = 0;

    virtual const char* name() const = 0;

    /**
     * @brief Installer for this configuration
     *
     * @param disabled --no-supervisor given
     * @param executable_path Used to find resolute-watchdog beside it
     */
    static std::unique_ptr<SupervisorInstaller> create(const Config& config,
                                                       const RuntimePaths& paths, bool disabled,
                                                       const std::string& executable_path);
};

/**
 * @brief Graceful degradation: no automatic relaunch
 */
class NullSupervisorInstaller : public SupervisorInstaller {
  public:
    bool install(const std::string& executable_path,
                 const std::vector<std::string>& args) override;
    bool uninstall() override;
    bool is_installed() const override {
        return false;
    }
    const char* name() const override {
        return "none";
    }
};

/**
 * @brief Launches one detached resolute-watchdog per user session
 *
 * The watchdog holds its own lock file; while that lock is held install()
 * does nothing.
 */
class WatchdogSupervisorInstaller : public SupervisorInstaller {
  public:
    struct Options {
        std::string watchdog_path;      ///< resolute-watchdog executable
        std::string watchdog_lock;      ///< Held by the running watchdog
        std::string instance_lock;      ///< Primary's instance lock (PID inside)
        std::string marker_path;        ///< Liveness marker
        int restart_delay_sec = 5;
    };

    explicit WatchdogSupervisorInstaller(Options options);

    bool install(const std::string& executable_path,
                 const std::vector<std::string>& args) override;
    bool uninstall() override;
    bool is_installed() const override;
    const char* name() const override {
        return "watchdog";
    }

    /**
     * @brief Command line the watchdog is started with
     */
    std::vector<std::string> watchdog_args(const std::string& executable_path,
                                           const std::vector<std::string>& args) const;

    const Options& options() const {
        return options_;
    }

  private:
    Options options_;
};

} // namespace resolute
