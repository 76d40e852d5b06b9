// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file resolute_watchdog.cpp
 * @brief Lightweight supervisor that relaunches resolute after abnormal exits
 *
 * Started detached by WatchdogSupervisorInstaller. It first attaches to the
 * running primary (PID from the instance lock) and polls for its death;
 * the liveness marker left behind tells whether that death was abnormal.
 * Relaunched processes are its own children, judged by exit status.
 *
 * Design goals:
 * - Minimal dependencies (spdlog only, no window system)
 * - Never duplicates a primary: a held instance lock means attach, not launch
 * - SIGTERM/SIGINT stop the watchdog and leave the application alone
 */

#include "app_constants.h"
#include "instance_arbiter.h"
#include "logging_init.h"
#include "process_utils.h"
#include "watchdog_policy.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace resolute;

// =============================================================================
// Global State
// =============================================================================

static volatile sig_atomic_t g_quit = 0;

static constexpr int PID_READ_ATTEMPTS = 10;
static constexpr int SLEEP_SLICE_MS = 100;

// =============================================================================
// Signal Handling
// =============================================================================

static void signal_handler(int /*sig*/) {
    g_quit = 1;
}

static void setup_signal_handlers() {
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a blocking waitpid() must return EINTR so we can quit
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    signal(SIGHUP, SIG_IGN);
    signal(SIGCHLD, SIG_DFL);
}

// =============================================================================
// Command Line Parsing
// =============================================================================

struct WatchdogArgs {
    std::string lock_path;
    std::string instance_lock;
    std::string marker_path;
    int restart_delay_sec = AppConstants::Restart::SUPERVISOR_DELAY_SEC;
    pid_t attach_pid = 0;
    std::string child_binary;
    std::vector<std::string> child_args;
};

static void print_usage(const char* program) {
    fprintf(stderr,
            "Usage: %s --lock <path> --instance-lock <path> --marker <path>\n"
            "          [--restart-delay <sec>] [--attach <pid>] -- <resolute> [args...]\n",
            program);
    fprintf(stderr, "  --lock <path>           Watchdog lock file (one watchdog at a time)\n");
    fprintf(stderr, "  --instance-lock <path>  Instance lock file of the supervised program\n");
    fprintf(stderr, "  --marker <path>         Liveness marker of the supervised program\n");
    fprintf(stderr, "  --restart-delay <sec>   Delay before a relaunch (default: %d)\n",
            AppConstants::Restart::SUPERVISOR_DELAY_SEC);
    fprintf(stderr, "  --attach <pid>          Supervise an already running process first\n");
    fprintf(stderr, "  --                      Separator before the program and its args\n");
}

static bool parse_args(int argc, char** argv, WatchdogArgs& args) {
    bool after_separator = false;

    for (int i = 1; i < argc; i++) {
        if (after_separator) {
            if (args.child_binary.empty()) {
                args.child_binary = argv[i];
            } else {
                args.child_args.push_back(argv[i]);
            }
        } else if (strcmp(argv[i], "--") == 0) {
            after_separator = true;
        } else if (strcmp(argv[i], "--lock") == 0 && i + 1 < argc) {
            args.lock_path = argv[++i];
        } else if (strcmp(argv[i], "--instance-lock") == 0 && i + 1 < argc) {
            args.instance_lock = argv[++i];
        } else if (strcmp(argv[i], "--marker") == 0 && i + 1 < argc) {
            args.marker_path = argv[++i];
        } else if (strcmp(argv[i], "--restart-delay") == 0 && i + 1 < argc) {
            args.restart_delay_sec = atoi(argv[++i]);
        } else if (strcmp(argv[i], "--attach") == 0 && i + 1 < argc) {
            args.attach_pid = static_cast<pid_t>(atoi(argv[++i]));
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            exit(0);
        } else {
            fprintf(stderr, "Error: unknown argument '%s'\n", argv[i]);
            print_usage(argv[0]);
            return false;
        }
    }

    if (args.child_binary.empty() || args.lock_path.empty() || args.instance_lock.empty() ||
        args.marker_path.empty()) {
        fprintf(stderr, "Error: missing required arguments\n");
        print_usage(argv[0]);
        return false;
    }
    if (args.restart_delay_sec < 0) {
        args.restart_delay_sec = 0;
    }

    return true;
}

// =============================================================================
// Helpers
// =============================================================================

/// Sleep in slices so SIGTERM is honored promptly
/// @return false if interrupted by a quit request
static bool interruptible_sleep_ms(int total_ms) {
    for (int slept = 0; slept < total_ms && !g_quit; slept += SLEEP_SLICE_MS) {
        std::this_thread::sleep_for(std::chrono::milliseconds(SLEEP_SLICE_MS));
    }
    return !g_quit;
}

static bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

static bool instance_running(const WatchdogArgs& args) {
    return InstanceLock::is_locked(args.instance_lock);
}

/// PID of the primary holding the instance lock (the holder may still be writing it)
static pid_t read_primary_pid(const WatchdogArgs& args) {
    for (int attempt = 0; attempt < PID_READ_ATTEMPTS && !g_quit; ++attempt) {
        auto pid = InstanceLock::read_holder_pid(args.instance_lock);
        if (pid) {
            return *pid;
        }
        interruptible_sleep_ms(SLEEP_SLICE_MS);
    }
    return 0;
}

// =============================================================================
// Process Management
// =============================================================================

/**
 * @brief Poll an attached (non-child) process until it dies
 * @return false if the watchdog was asked to quit first
 */
static bool wait_for_attached_death(pid_t pid) {
    while (!g_quit) {
        if (kill(pid, 0) != 0 && errno == ESRCH) {
            return true;
        }
        interruptible_sleep_ms(AppConstants::Restart::ATTACH_POLL_INTERVAL_MS);
    }
    return false;
}

/**
 * @brief Fork and exec the supervised program, wait for it to exit
 * @return Observation of the death; g_quit is set if we stopped waiting
 */
static DeathObservation run_child_process(const WatchdogArgs& args) {
    DeathObservation death;
    death.was_child = true;

    ExecImage image(args.child_binary, args.child_args, {{AppConstants::SUPERVISED_ENV, "1"}});

    spdlog::info("[Watchdog] Launching: {}", args.child_binary);
    pid_t child_pid = fork();

    if (child_pid < 0) {
        spdlog::error("[Watchdog] fork() failed: {}", strerror(errno));
        death.exit_code = 127;
        return death;
    }

    if (child_pid == 0) {
        // Leave the watchdog's session so stopping one never stops the other
        setsid();
        execve(image.path(), image.argv(), image.envp());
        fprintf(stderr, "[Watchdog] execve failed: %s\n", strerror(errno));
        _exit(127);
    }

    int status = 0;
    while (true) {
        pid_t result = waitpid(child_pid, &status, 0);
        if (result == child_pid) {
            break;
        }
        if (result < 0 && errno == EINTR) {
            if (g_quit) {
                spdlog::info("[Watchdog] Stopping; leaving PID {} running", child_pid);
                return death;
            }
            continue;
        }
        spdlog::error("[Watchdog] waitpid error: {}", strerror(errno));
        death.exit_code = 127;
        return death;
    }

    WaitResult wait = decode_wait_status(status);
    death.signaled = wait.signaled;
    death.signal = wait.signal;
    death.exit_code = wait.exit_code;
    death.marker_present = file_exists(args.marker_path);

    if (wait.signaled) {
        spdlog::warn("[Watchdog] Child killed by signal {} ({})", wait.signal,
                     strsignal(wait.signal));
    } else {
        spdlog::info("[Watchdog] Child exited with code {}", wait.exit_code);
    }
    return death;
}

// =============================================================================
// Main Loop
// =============================================================================

static int run_watchdog(const WatchdogArgs& args) {
    InstanceLock lock(args.lock_path);
    if (!lock.try_acquire()) {
        spdlog::info("[Watchdog] Another watchdog holds {}, exiting", args.lock_path);
        return 0;
    }

    pid_t attach_pid = args.attach_pid;
    if (attach_pid <= 0 && instance_running(args)) {
        attach_pid = read_primary_pid(args);
    }

    while (!g_quit) {
        DeathObservation death;

        if (attach_pid > 0) {
            spdlog::info("[Watchdog] Attached to PID {}", attach_pid);
            if (!wait_for_attached_death(attach_pid)) {
                break;
            }
            death.was_child = false;
            death.marker_present = file_exists(args.marker_path);
            spdlog::info("[Watchdog] PID {} is gone (liveness marker {})", attach_pid,
                         death.marker_present ? "present" : "absent");
            attach_pid = 0;
        } else {
            death = run_child_process(args);
            if (g_quit) {
                break;
            }
        }

        bool abnormal = is_abnormal_death(death);
        if (abnormal) {
            spdlog::warn("[Watchdog] Abnormal exit, relaunching in {}s", args.restart_delay_sec);
            if (!interruptible_sleep_ms(args.restart_delay_sec * 1000)) {
                break;
            }
        }

        WatchdogAction action = next_action(abnormal, instance_running(args));
        spdlog::info("[Watchdog] Next action: {}", watchdog_action_name(action));

        switch (action) {
        case WatchdogAction::Stop:
            spdlog::info("[Watchdog] Clean exit observed, supervision ends");
            return 0;
        case WatchdogAction::Attach:
            // Lock held but no PID yet: keep looking while the holder lives
            while (!g_quit && attach_pid <= 0 && instance_running(args)) {
                attach_pid = read_primary_pid(args);
            }
            break;
        case WatchdogAction::Relaunch:
            // Loop around with attach_pid == 0: launch as our child
            break;
        }
    }

    spdlog::info("[Watchdog] Shutting down");
    return 0;
}

int main(int argc, char** argv) {
    setup_signal_handlers();

    WatchdogArgs args;
    if (!parse_args(argc, argv, args)) {
        return 1;
    }

    logging::LogConfig log_config;
    log_config.level = spdlog::level::info;
    log_config.target = logging::LogTarget::Auto;
    log_config.enable_console = true;
    log_config.ident = "resolute-watchdog";
    logging::init(log_config);

    return run_watchdog(args);
}
