// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "process_utils.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <set>
#include <sys/resource.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace fs = std::filesystem;

namespace resolute {

ExecImage::ExecImage(std::string program, const std::vector<std::string>& args,
                     const std::vector<std::pair<std::string, std::string>>& env_overrides)
    : program_(std::move(program)) {
    arg_storage_.push_back(program_);
    arg_storage_.insert(arg_storage_.end(), args.begin(), args.end());

    std::set<std::string> overridden;
    for (const auto& [name, value] : env_overrides) {
        overridden.insert(name);
        env_storage_.push_back(name + "=" + value);
    }
    for (char** env = environ; env && *env; ++env) {
        const char* eq = strchr(*env, '=');
        std::string name = eq ? std::string(*env, eq - *env) : std::string(*env);
        if (overridden.count(name) == 0) {
            env_storage_.emplace_back(*env);
        }
    }

    for (auto& arg : arg_storage_) {
        argv_.push_back(const_cast<char*>(arg.c_str()));
    }
    argv_.push_back(nullptr);
    for (auto& var : env_storage_) {
        envp_.push_back(const_cast<char*>(var.c_str()));
    }
    envp_.push_back(nullptr);
}

void close_inherited_fds(int first_fd) {
    struct rlimit rl;
    int max_fd = 1024;
    if (getrlimit(RLIMIT_NOFILE, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY) {
        max_fd = static_cast<int>(rl.rlim_cur);
    }
    // Keep the loop bounded when the soft limit is huge
    if (max_fd > 65536) {
        max_fd = 65536;
    }
    for (int fd = first_fd; fd < max_fd; ++fd) {
        close(fd);
    }
}

void redirect_stdio_to_devnull() {
    int devnull = open("/dev/null", O_RDWR);
    if (devnull < 0) {
        return;
    }
    dup2(devnull, STDIN_FILENO);
    dup2(devnull, STDOUT_FILENO);
    dup2(devnull, STDERR_FILENO);
    if (devnull > STDERR_FILENO) {
        close(devnull);
    }
}

std::string sibling_path(const std::string& executable_path, const char* name) {
    if (executable_path.empty()) {
        return name;
    }
    return (fs::path(executable_path).parent_path() / name).string();
}

WaitResult decode_wait_status(int status) {
    WaitResult result;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    }
    return result;
}

std::string describe_wait_result(const WaitResult& result) {
    if (result.error) {
        return "wait failed: " + result.error_message;
    }
    if (result.timed_out) {
        return "timed out";
    }
    if (result.signaled) {
        return "signal " + std::to_string(result.signal) + " (" + strsignal(result.signal) + ")";
    }
    return "exit code " + std::to_string(result.exit_code);
}

WaitResult wait_for_child_with_timeout(pid_t pid, int timeout_ms, const char* operation_name) {
    constexpr int POLL_INTERVAL_MS = 50;
    WaitResult result;

    int status = 0;
    auto start_time = std::chrono::steady_clock::now();

    while (true) {
        pid_t wait_result = waitpid(pid, &status, WNOHANG);

        if (wait_result == pid) {
            return decode_wait_status(status);
        }

        if (wait_result < 0) {
            // Signal interrupted waitpid, just retry
            if (errno == EINTR) {
                continue;
            }
            result.error = true;
            result.error_message = strerror(errno);
            spdlog::error("[Process] {}: waitpid error: {}", operation_name, result.error_message);
            return result;
        }

        if (timeout_ms >= 0) {
            auto elapsed = std::chrono::steady_clock::now() - start_time;
            if (elapsed > std::chrono::milliseconds(timeout_ms)) {
                spdlog::error("[Process] {} timed out after {} ms", operation_name, timeout_ms);
                kill(pid, SIGTERM);
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
                kill(pid, SIGKILL); // Force kill if still running

                // Reap the zombie (blocking, but child should be dead)
                while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
                }

                result.timed_out = true;
                return result;
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }
}

pid_t spawn_delayed_relaunch(const ExecImage& image, unsigned delay_ms) {
    pid_t pid = fork();
    if (pid < 0) {
        return -1;
    }
    if (pid > 0) {
        return pid;
    }

    // Child: async-signal-safe calls only from here on
    setsid();
    close_inherited_fds(STDERR_FILENO + 1);

    // Sleep in one-second chunks plus the remainder; sleep() and nanosleep()
    // are both async-signal-safe
    unsigned remaining_ms = delay_ms;
    while (remaining_ms >= 1000) {
        sleep(1);
        remaining_ms -= 1000;
    }
    if (remaining_ms > 0) {
        struct timespec ts;
        ts.tv_sec = 0;
        ts.tv_nsec = static_cast<long>(remaining_ms) * 1000000L;
        nanosleep(&ts, nullptr);
    }

    execve(image.path(), image.argv(), image.envp());
    _exit(127);
}

} // namespace resolute
