// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "supervisor_installer.h"

#include "app_constants.h"
#include "config.h"
#include "instance_arbiter.h"
#include "process_utils.h"
#include "restart_store.h"
#include "runtime_paths.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <unistd.h>

namespace resolute {

namespace {

constexpr int LAUNCH_TIMEOUT_MS = 5000;

} // namespace

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<SupervisorInstaller> SupervisorInstaller::create(
    const Config& config, const RuntimePaths& paths, bool disabled,
    const std::string& executable_path) {
    if (disabled) {
        spdlog::info("[Supervisor] Disabled on the command line");
        return std::make_unique<NullSupervisorInstaller>();
    }
    if (!config.get<bool>("/supervisor/enabled", true)) {
        spdlog::info("[Supervisor] Disabled in config");
        return std::make_unique<NullSupervisorInstaller>();
    }

    WatchdogSupervisorInstaller::Options options;
    options.watchdog_path = sibling_path(executable_path, AppConstants::WATCHDOG_BINARY);
    options.watchdog_lock = paths.watchdog_lock_file();
    options.instance_lock = paths.instance_lock_file();
    options.marker_path = paths.state_dir + "/" + LivenessMarker::KEY;
    options.restart_delay_sec = static_cast<int>(config.get_in_range(
        "/supervisor/restart_delay_sec", AppConstants::Restart::SUPERVISOR_DELAY_SEC,
        AppConstants::Restart::MIN_SUPERVISOR_DELAY_SEC,
        AppConstants::Restart::MAX_SUPERVISOR_DELAY_SEC));
    return std::make_unique<WatchdogSupervisorInstaller>(std::move(options));
}

// ============================================================================
// NullSupervisorInstaller
// ============================================================================

bool NullSupervisorInstaller::install(const std::string& /*executable_path*/,
                                      const std::vector<std::string>& /*args*/) {
    spdlog::warn("[Supervisor] No supervisor registered; abnormal exits will not be relaunched");
    return false;
}

bool NullSupervisorInstaller::uninstall() {
    return true;
}

// ============================================================================
// WatchdogSupervisorInstaller
// ============================================================================

WatchdogSupervisorInstaller::WatchdogSupervisorInstaller(Options options)
    : options_(std::move(options)) {}

bool WatchdogSupervisorInstaller::is_installed() const {
    return InstanceLock::is_locked(options_.watchdog_lock);
}

std::vector<std::string>
WatchdogSupervisorInstaller::watchdog_args(const std::string& executable_path,
                                           const std::vector<std::string>& args) const {
    std::vector<std::string> argv = {"--lock",
                                     options_.watchdog_lock,
                                     "--instance-lock",
                                     options_.instance_lock,
                                     "--marker",
                                     options_.marker_path,
                                     "--restart-delay",
                                     std::to_string(options_.restart_delay_sec),
                                     "--attach",
                                     std::to_string(getpid()),
                                     "--",
                                     executable_path};
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

bool WatchdogSupervisorInstaller::install(const std::string& executable_path,
                                          const std::vector<std::string>& args) {
    if (is_installed()) {
        spdlog::debug("[Supervisor] Watchdog already running (PID {})",
                      InstanceLock::read_holder_pid(options_.watchdog_lock).value_or(-1));
        return true;
    }

    if (access(options_.watchdog_path.c_str(), X_OK) != 0) {
        spdlog::warn("[Supervisor] Watchdog not found or not executable: {}",
                     options_.watchdog_path);
        return false;
    }

    ExecImage image(options_.watchdog_path, watchdog_args(executable_path, args));

    // Double fork + setsid: the watchdog is reparented to init and survives
    // our session and our death
    pid_t pid = fork();
    if (pid < 0) {
        spdlog::warn("[Supervisor] fork() failed: {}", strerror(errno));
        return false;
    }

    if (pid == 0) {
        setsid();
        pid_t daemon_pid = fork();
        if (daemon_pid != 0) {
            _exit(daemon_pid < 0 ? 1 : 0);
        }
        redirect_stdio_to_devnull();
        close_inherited_fds(STDERR_FILENO + 1);
        execve(image.path(), image.argv(), image.envp());
        _exit(127);
    }

    WaitResult result = wait_for_child_with_timeout(pid, LAUNCH_TIMEOUT_MS, "Watchdog launch");
    if (result.error || result.timed_out || result.signaled || result.exit_code != 0) {
        spdlog::warn("[Supervisor] Watchdog launch failed: {}", describe_wait_result(result));
        return false;
    }

    spdlog::info("[Supervisor] Watchdog launched: {}", options_.watchdog_path);
    return true;
}

bool WatchdogSupervisorInstaller::uninstall() {
    if (!is_installed()) {
        spdlog::info("[Supervisor] No watchdog running");
        return true;
    }

    auto pid = InstanceLock::read_holder_pid(options_.watchdog_lock);
    if (!pid) {
        spdlog::error("[Supervisor] Watchdog lock held but no PID in {}", options_.watchdog_lock);
        return false;
    }
    if (kill(*pid, SIGTERM) != 0) {
        spdlog::error("[Supervisor] Cannot signal watchdog PID {}: {}", *pid, strerror(errno));
        return false;
    }
    spdlog::info("[Supervisor] Sent SIGTERM to watchdog PID {}", *pid);
    return true;
}

} // namespace resolute
