// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file task_executor.h
 * @brief Runs CPU-bound work in a separate worker process
 *
 * The worker is fork+exec'd with stdout/stderr on pipes. A reader thread
 * splits its output into lines and hands them to the caller; when both
 * pipes close it reaps the worker and resolves the run's future exactly once.
 *
 * Usage:
 * @code
 * TaskExecutor executor({"/usr/bin/resolute-worker", {}, {}});
 * auto future = executor.start_task([&loop](const OutputLine& line) {
 *     // Reader thread: hand off to the main loop
 *     loop.post([line] { show_status(line.text); });
 * });
 * @endcode
 *
 * One run at a time: start_task() while a worker is running returns an
 * already-resolved failure and starts nothing. start_task() and terminate()
 * are meant to be called from a single (the main loop) thread.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <utility>
#include <vector>

namespace resolute {

enum class TaskRunState { NotStarted, Running, Succeeded, Failed };

const char* task_run_state_name(TaskRunState state);

enum class OutputStream { Stdout, Stderr };

struct OutputLine {
    OutputStream stream = OutputStream::Stdout;
    std::string text; ///< Without the trailing newline; lines over 64 KiB arrive in pieces
};

/**
 * @brief How a run ended
 *
 * - success, exit_code 0: worker exited 0
 * - !success, exit_code >= 1: worker exited non-zero (128+N when killed by signal N)
 * - !success, exit_code -1: worker never ran (spawn failure, or rejected)
 */
struct TaskResult {
    bool success = false;
    int exit_code = -1;
    std::string error;
};

/**
 * @brief Single-resolution promise for one run
 *
 * Any number of completion paths may call resolve(); only the first one
 * reaches the future.
 */
class TaskRun {
  public:
    TaskRun() = default;
    TaskRun(const TaskRun&) = delete;
    TaskRun& operator=(const TaskRun&) = delete;

    std::future<TaskResult> get_future() {
        return promise_.get_future();
    }

    /**
     * @return true if this call resolved the run
     */
    bool resolve(TaskResult result);

    bool resolved() const {
        return resolved_.load();
    }

  private:
    std::promise<TaskResult> promise_;
    std::atomic<bool> resolved_{false};
};

/**
 * @brief What to launch
 */
struct WorkerCommand {
    std::string program;                                       ///< Absolute path
    std::vector<std::string> args;                             ///< argv[1..]
    std::vector<std::pair<std::string, std::string>> env;      ///< Added to our environment
};

class TaskExecutor {
  public:
    /// Called on the reader thread, in emission order per stream
    using OutputCallback = std::function<void(const OutputLine&)>;

    explicit TaskExecutor(WorkerCommand command);

    /**
     * @brief Terminates a running worker and joins the reader thread
     */
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    /**
     * @brief Launch the worker
     *
     * Never throws for spawn problems: a missing executable resolves the
     * future with {false, -1, reason}.
     */
    std::future<TaskResult> start_task(OutputCallback on_output = nullptr);

    TaskRunState state() const;
    bool is_running() const;

    /// PID of the running worker, -1 when none
    pid_t worker_pid() const;

    /**
     * @brief Stop a running worker: SIGTERM, then SIGKILL after a grace period
     *
     * Blocks until the reader has resolved the run.
     *
     * @return false if no worker was running
     */
    bool terminate(int grace_ms = 2000);

    /// Keep the last n lines for retained_output() (0 = keep none)
    void set_max_retained_lines(size_t n);
    std::vector<OutputLine> retained_output() const;

    const WorkerCommand& command() const {
        return command_;
    }

  private:
    void pump_output(std::shared_ptr<TaskRun> run, pid_t pid, int out_fd, int err_fd,
                     OutputCallback on_output);
    void emit_line(OutputLine line, const OutputCallback& on_output);
    void finish(const std::shared_ptr<TaskRun>& run, TaskResult result);
    void join_reader();

    WorkerCommand command_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    TaskRunState state_ = TaskRunState::NotStarted;
    pid_t pid_ = -1;
    size_t max_retained_ = 0;
    std::deque<OutputLine> retained_;

    std::thread reader_;
};

} // namespace resolute
