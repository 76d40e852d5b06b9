// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file process_utils.h
 * @brief fork/exec helpers shared by the executor, the installer, the crash
 *        handler and the watchdog
 *
 * Everything that runs between fork() and exec() in a process that may
 * have other threads must be async-signal-safe, so argv/envp are always
 * prepared before forking (ExecImage).
 */

#pragma once

#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace resolute {

/**
 * @brief Pre-built argv/envp for execve()
 *
 * Owns the strings; argv()/envp() stay valid as long as the image lives
 * and is not modified.
 */
class ExecImage {
  public:
    /**
     * @param program Absolute path of the executable (no PATH search)
     * @param args argv[1..]
     * @param env_overrides Variables set on top of the current environment
     */
    ExecImage(std::string program, const std::vector<std::string>& args,
              const std::vector<std::pair<std::string, std::string>>& env_overrides = {});

    ExecImage(const ExecImage&) = delete;
    ExecImage& operator=(const ExecImage&) = delete;

    const char* path() const {
        return program_.c_str();
    }
    char* const* argv() const {
        return argv_.data();
    }
    char* const* envp() const {
        return envp_.data();
    }

  private:
    std::string program_;
    std::vector<std::string> arg_storage_;
    std::vector<std::string> env_storage_;
    std::vector<char*> argv_;
    std::vector<char*> envp_;
};

/**
 * @brief Close every descriptor >= first_fd
 *
 * Async-signal-safe; used in forked children so inherited locks die with
 * the parent.
 */
void close_inherited_fds(int first_fd);

/**
 * @brief Point fds 0, 1 and 2 at /dev/null (async-signal-safe)
 */
void redirect_stdio_to_devnull();

/// Path of another executable installed beside @p executable_path
std::string sibling_path(const std::string& executable_path, const char* name);

/**
 * @brief Wait result from wait_for_child_with_timeout()
 */
struct WaitResult {
    bool timed_out = false;
    bool error = false;
    bool signaled = false;
    int exit_code = -1;
    int signal = 0;
    std::string error_message;
};

/**
 * @brief Wait for child process with timeout, handling EINTR
 *
 * Polls with non-blocking waitpid. A child still running at the timeout is
 * sent SIGTERM, then SIGKILL, and reaped.
 *
 * @param timeout_ms Maximum time to wait (< 0 waits forever)
 */
WaitResult wait_for_child_with_timeout(pid_t pid, int timeout_ms, const char* operation_name);

/**
 * @brief Decode a waitpid() status into a WaitResult
 */
WaitResult decode_wait_status(int status);

/**
 * @brief Start a detached copy of a program after a delay
 *
 * Forks a child that leaves our session, closes every inherited descriptor
 * (releasing the instance lock it would otherwise keep alive), sleeps and
 * execs the image. The caller does not wait for it.
 *
 * @return PID of the relauncher child, or -1 if fork failed
 */
pid_t spawn_delayed_relaunch(const ExecImage& image, unsigned delay_ms);

/**
 * @brief Human-readable description of a wait status ("exit code 3", "signal 9 (Killed)")
 */
std::string describe_wait_result(const WaitResult& result);

} // namespace resolute
