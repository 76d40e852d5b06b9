// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "task_executor.h"

#include "app_constants.h"
#include "process_utils.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace resolute {

namespace {

/// pipe() with FD_CLOEXEC on both ends (pipe2 is Linux-only)
bool make_cloexec_pipe(int fds[2]) {
    if (pipe(fds) != 0) {
        return false;
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::future<TaskResult> resolved_future(TaskResult result) {
    TaskRun run;
    auto future = run.get_future();
    run.resolve(std::move(result));
    return future;
}

/// Signal the worker's process group, falling back to the worker itself
void signal_worker(pid_t pid, int sig) {
    if (kill(-pid, sig) != 0) {
        kill(pid, sig);
    }
}

} // namespace

const char* task_run_state_name(TaskRunState state) {
    switch (state) {
    case TaskRunState::NotStarted:
        return "NotStarted";
    case TaskRunState::Running:
        return "Running";
    case TaskRunState::Succeeded:
        return "Succeeded";
    case TaskRunState::Failed:
        return "Failed";
    }
    return "Invalid";
}

bool TaskRun::resolve(TaskResult result) {
    bool expected = false;
    if (!resolved_.compare_exchange_strong(expected, true)) {
        spdlog::debug("[TaskExecutor] Ignoring repeated resolution");
        return false;
    }
    promise_.set_value(std::move(result));
    return true;
}

TaskExecutor::TaskExecutor(WorkerCommand command) : command_(std::move(command)) {}

TaskExecutor::~TaskExecutor() {
    if (is_running()) {
        terminate(AppConstants::Task::TERMINATE_GRACE_MS);
    }
    join_reader();
}

TaskRunState TaskExecutor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool TaskExecutor::is_running() const {
    return state() == TaskRunState::Running;
}

pid_t TaskExecutor::worker_pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

void TaskExecutor::set_max_retained_lines(size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_retained_ = n;
    while (retained_.size() > max_retained_) {
        retained_.pop_front();
    }
}

std::vector<OutputLine> TaskExecutor::retained_output() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {retained_.begin(), retained_.end()};
}

void TaskExecutor::join_reader() {
    if (reader_.joinable()) {
        reader_.join();
    }
}

std::future<TaskResult> TaskExecutor::start_task(OutputCallback on_output) {
    if (is_running()) {
        spdlog::warn("[TaskExecutor] start_task rejected: worker PID {} still running",
                     worker_pid());
        return resolved_future({false, -1, "a task is already running"});
    }

    // The previous run has resolved; its reader may still be returning
    join_reader();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (!make_cloexec_pipe(out_pipe) || !make_cloexec_pipe(err_pipe) ||
        !make_cloexec_pipe(exec_pipe)) {
        std::string reason = std::string("cannot create pipes: ") + strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0],
                        &exec_pipe[1]}) {
            close_fd(*fd);
        }
        spdlog::error("[TaskExecutor] {}", reason);
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = TaskRunState::Failed;
        return resolved_future({false, -1, reason});
    }

    // Built before fork: only async-signal-safe calls run in the child
    ExecImage image(command_.program, command_.args, command_.env);

    pid_t pid = fork();
    if (pid < 0) {
        std::string reason = std::string("fork failed: ") + strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0],
                        &exec_pipe[1]}) {
            close_fd(*fd);
        }
        spdlog::error("[TaskExecutor] {}", reason);
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = TaskRunState::Failed;
        return resolved_future({false, -1, reason});
    }

    if (pid == 0) {
        // Own process group: terminal signals aimed at us don't reach the worker,
        // and terminate() can take down anything it spawns
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        execve(image.path(), image.argv(), image.envp());

        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // EOF means exec succeeded (CLOEXEC closed the write end); data is errno
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);

        std::string reason =
            "failed to launch " + command_.program + ": " + strerror(exec_errno);
        spdlog::error("[TaskExecutor] {}", reason);
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = TaskRunState::Failed;
        return resolved_future({false, -1, reason});
    }

    auto run = std::make_shared<TaskRun>();
    auto future = run->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = TaskRunState::Running;
        pid_ = pid;
        retained_.clear();
    }

    spdlog::info("[TaskExecutor] Started {} (PID {})", command_.program, pid);
    reader_ = std::thread(&TaskExecutor::pump_output, this, run, pid, out_pipe[0], err_pipe[0],
                          std::move(on_output));
    return future;
}

void TaskExecutor::emit_line(OutputLine line, const OutputCallback& on_output) {
    if (!line.text.empty() && line.text.back() == '\r') {
        line.text.pop_back();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (max_retained_ > 0) {
            retained_.push_back(line);
            while (retained_.size() > max_retained_) {
                retained_.pop_front();
            }
        }
    }

    if (!on_output) {
        return;
    }
    try {
        on_output(line);
    } catch (const std::exception& e) {
        spdlog::error("[TaskExecutor] Output callback threw: {}", e.what());
    }
}

void TaskExecutor::pump_output(std::shared_ptr<TaskRun> run, pid_t pid, int out_fd, int err_fd,
                               OutputCallback on_output) {
    struct Stream {
        int fd;
        OutputStream kind;
        std::string partial;
    };
    Stream streams[2] = {{out_fd, OutputStream::Stdout, {}}, {err_fd, OutputStream::Stderr, {}}};

    char buf[4096];
    while (streams[0].fd >= 0 || streams[1].fd >= 0) {
        struct pollfd pfds[2];
        Stream* polled[2];
        nfds_t count = 0;
        for (auto& stream : streams) {
            if (stream.fd >= 0) {
                pfds[count].fd = stream.fd;
                pfds[count].events = POLLIN;
                pfds[count].revents = 0;
                polled[count] = &stream;
                ++count;
            }
        }

        int rc = poll(pfds, count, AppConstants::Task::READER_POLL_MS);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[TaskExecutor] poll failed: {}", strerror(errno));
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((pfds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) == 0) {
                continue;
            }
            Stream& stream = *polled[i];
            ssize_t r = read(stream.fd, buf, sizeof(buf));
            if (r > 0) {
                // Only the new bytes can hold a newline not seen yet
                size_t scan_from = stream.partial.size();
                stream.partial.append(buf, static_cast<size_t>(r));
                size_t start = 0;
                size_t nl;
                while ((nl = stream.partial.find('\n', scan_from)) != std::string::npos) {
                    emit_line({stream.kind, stream.partial.substr(start, nl - start)}, on_output);
                    start = nl + 1;
                    scan_from = start;
                }
                // An unterminated line is cut into MAX_LINE_BYTES pieces
                while (stream.partial.size() - start >= AppConstants::Task::MAX_LINE_BYTES) {
                    emit_line({stream.kind,
                               stream.partial.substr(start, AppConstants::Task::MAX_LINE_BYTES)},
                              on_output);
                    start += AppConstants::Task::MAX_LINE_BYTES;
                }
                stream.partial.erase(0, start);
            } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
                // EOF (or a dead pipe): flush an unterminated last line
                if (!stream.partial.empty()) {
                    emit_line({stream.kind, std::move(stream.partial)}, on_output);
                    stream.partial.clear();
                }
                close_fd(stream.fd);
            }
        }
    }
    for (auto& stream : streams) {
        close_fd(stream.fd);
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        finish(run, {false, -1, std::string("waitpid failed: ") + strerror(errno)});
        return;
    }

    WaitResult wait = decode_wait_status(status);
    if (!wait.signaled && wait.exit_code == 0) {
        finish(run, {true, 0, {}});
    } else {
        finish(run, {false, wait.exit_code, "worker ended with " + describe_wait_result(wait)});
    }
}

void TaskExecutor::finish(const std::shared_ptr<TaskRun>& run, TaskResult result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = result.success ? TaskRunState::Succeeded : TaskRunState::Failed;
        pid_ = -1;
    }
    state_cv_.notify_all();

    if (result.success) {
        spdlog::info("[TaskExecutor] Worker finished successfully");
    } else {
        spdlog::warn("[TaskExecutor] Worker failed: {}", result.error);
    }
    run->resolve(std::move(result));
}

bool TaskExecutor::terminate(int grace_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ != TaskRunState::Running) {
        return false;
    }
    pid_t pid = pid_;

    spdlog::info("[TaskExecutor] Terminating worker PID {}", pid);
    signal_worker(pid, SIGTERM);

    auto not_running = [this] { return state_ != TaskRunState::Running; };
    if (!state_cv_.wait_for(lock, std::chrono::milliseconds(grace_ms), not_running)) {
        spdlog::warn("[TaskExecutor] Worker PID {} ignored SIGTERM, sending SIGKILL", pid);
        signal_worker(pid, SIGKILL);
        state_cv_.wait(lock, not_running);
    }
    return true;
}

} // namespace resolute
