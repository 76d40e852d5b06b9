// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "config.h"
#include "exit_classifier.h"
#include "instance_arbiter.h"
#include "main_loop.h"
#include "restart_store.h"
#include "runtime_paths.h"
#include "startup_config.h"
#include "surface_backend.h"
#include "task_executor.h"
#include "window_lifecycle.h"

#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace resolute {

class ExecImage;
class SupervisorInstaller;

/**
 * @brief Process-level orchestrator that keeps resolute alive
 *
 * Owns the instance lock, the quit intent, the window lifecycle, the liveness
 * marker, the main loop and the background task executor. Coordinates:
 * 1. Single-instance arbitration (secondaries forward and exit clean)
 * 2. Crash report of the previous run
 * 3. Fault handlers (fatal signals, std::terminate, loop callback exceptions)
 * 4. Liveness marker, then supervisor registration, then the surface
 * 5. The cooperative main loop until a sanctioned exit
 * 6. Final teardown and exit classification
 *
 * Usage:
 *   ResilienceController controller(startup, config, paths, std::move(backend),
 *                                   std::move(installer));
 *   return controller.run();
 *
 * Tests drive the phases individually: start(), step(now_ms), finish().
 */
class ResilienceController {
  public:
    ResilienceController(StartupConfig startup, const Config& config, RuntimePaths paths,
                         std::unique_ptr<SurfaceBackend> backend,
                         std::unique_ptr<SupervisorInstaller> installer,
                         MainLoop::TickSource ticks = nullptr);
    ~ResilienceController();

    // Non-copyable, non-movable
    ResilienceController(const ResilienceController&) = delete;
    ResilienceController& operator=(const ResilienceController&) = delete;
    ResilienceController(ResilienceController&&) = delete;
    ResilienceController& operator=(ResilienceController&&) = delete;

    /**
     * @brief start(), loop until a sanctioned exit, finish()
     * @return Process exit code (0 = clean, 1 = abnormal)
     */
    int run();

    /**
     * @brief Startup sequence up to the first loop iteration
     *
     * A Secondary forwards its activation intent to the primary and does
     * nothing else; finish() then returns the clean code.
     */
    InstanceRole start();

    /// One loop iteration: surface events, signal flags, loop work, task completion
    void step();
    void step(uint64_t now_ms);

    /// True once a sanctioned exit has been requested and the loop should stop
    bool exit_requested() const {
        return m_exit_requested;
    }

    /**
     * @brief Final teardown; consults the exit classifier exactly once
     * @return Process exit code
     */
    int finish();

    /// Sanctioned exit control (Ctrl+Q, resolute --quit, SIGUSR2)
    void request_exit();

    /// Bring the surface to the front (SIGUSR1, Ctrl+S, second instance)
    void request_show();

    /**
     * @brief Start the background task (Ctrl+T, --run-task)
     * @return false if a task is already running or the worker failed to launch
     */
    bool start_background_task();

    /**
     * @brief Fault path: log, relaunch detached, terminate abnormally
     *
     * If the user already asked to exit, that exit stands: the marker is
     * cleared and the process ends clean without a relaunch.
     */
    [[noreturn]] void on_fault(const std::string& reason);

    /// What a Secondary forwards to the primary (default Show)
    void set_secondary_intent(ActivationIntent intent) {
        m_secondary_intent = intent;
    }

    /// Replace the worker command (only while no task is running)
    bool set_worker_command(WorkerCommand command);

    /// Worker command from config (/worker/path) or beside the executable
    static WorkerCommand default_worker_command(const Config& config,
                                                const std::string& executable_path);

    // Accessors
    const StartupConfig& startup() const {
        return m_startup;
    }
    const QuitIntentRecorder& intent() const {
        return m_intent;
    }
    const WindowLifecycle& lifecycle() const {
        return m_lifecycle;
    }
    MainLoop& loop() {
        return m_loop;
    }
    const TaskExecutor& executor() const {
        return *m_executor;
    }
    const LivenessMarker& marker() const {
        return m_marker;
    }
    const InstanceArbiter& arbiter() const {
        return m_arbiter;
    }
    std::optional<InstanceRole> role() const {
        return m_role;
    }
    const std::optional<TaskResult>& last_task_result() const {
        return m_last_task_result;
    }
    const std::string& last_status() const {
        return m_last_status;
    }
    unsigned relaunch_delay_ms() const {
        return m_relaunch_delay_ms;
    }

  private:
    void consume_crash_report();
    void install_fault_handlers();
    void uninstall_fault_handlers();
    void dispatch(SurfaceEvent event);
    void dispatch_signals();
    void handle_quit_gesture(bool allowed);
    void on_task_output(const OutputLine& line);
    void poll_task();
    void set_status(const std::string& text);

    static void terminate_handler();

    StartupConfig m_startup;
    const Config& m_config;
    RuntimePaths m_paths;

    std::unique_ptr<SurfaceBackend> m_backend;
    std::unique_ptr<SupervisorInstaller> m_installer;

    QuitIntentRecorder m_intent;
    ExitClassifier m_classifier;
    InstanceArbiter m_arbiter;
    RestartStore m_store;
    LivenessMarker m_marker;

    // Declared before the executor: its reader thread posts into the loop
    MainLoop m_loop;
    WindowLifecycle m_lifecycle;
    std::unique_ptr<TaskExecutor> m_executor;

    std::unique_ptr<ExecImage> m_relaunch_image;
    unsigned m_relaunch_delay_ms;

    std::optional<InstanceRole> m_role;
    ActivationIntent m_secondary_intent = ActivationIntent::Show;
    bool m_exit_requested = false;
    bool m_fault_handlers_installed = false;
    bool m_finished = false;
    std::terminate_handler m_previous_terminate = nullptr;

    std::optional<std::future<TaskResult>> m_pending_task;
    std::optional<TaskResult> m_last_task_result;
    std::string m_last_status;
};

} // namespace resolute
