// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "resilience_controller.h"

#include "app_constants.h"
#include "process_utils.h"
#include "supervisor_installer.h"
#include "system/crash_handler.h"
#include "system/process_signals.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <thread>
#include <unistd.h>

namespace resolute {

namespace {

/// Controller that owns std::terminate while its fault handlers are installed
ResilienceController* s_active = nullptr;

std::unique_ptr<SurfaceBackend> backend_or_mock(std::unique_ptr<SurfaceBackend> backend) {
    if (backend) {
        return backend;
    }
    spdlog::warn("[Controller] No surface backend given, using mock");
    return SurfaceBackend::create("mock", AppConstants::Display::DEFAULT_WIDTH,
                                  AppConstants::Display::DEFAULT_HEIGHT);
}

std::unique_ptr<SupervisorInstaller>
installer_or_null(std::unique_ptr<SupervisorInstaller> installer) {
    if (installer) {
        return installer;
    }
    return std::make_unique<NullSupervisorInstaller>();
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

WorkerCommand ResilienceController::default_worker_command(const Config& config,
                                                           const std::string& executable_path) {
    WorkerCommand command;
    command.program = config.get<std::string>("/worker/path", "");
    if (command.program.empty()) {
        command.program = sibling_path(executable_path, AppConstants::WORKER_BINARY);
    }
    return command;
}

ResilienceController::ResilienceController(StartupConfig startup, const Config& config,
                                           RuntimePaths paths,
                                           std::unique_ptr<SurfaceBackend> backend,
                                           std::unique_ptr<SupervisorInstaller> installer,
                                           MainLoop::TickSource ticks)
    : m_startup(std::move(startup)), m_config(config), m_paths(std::move(paths)),
      m_backend(backend_or_mock(std::move(backend))),
      m_installer(installer_or_null(std::move(installer))),
      m_arbiter(m_paths.instance_lock_file()), m_store(m_paths.state_dir), m_marker(m_store),
      m_loop(std::move(ticks)),
      m_lifecycle(*m_backend, m_loop, m_intent, LifecyclePolicy::from_config(config)),
      m_executor(std::make_unique<TaskExecutor>(
          default_worker_command(config, m_startup.executable_path))) {
    m_relaunch_delay_ms = static_cast<unsigned>(config.get_in_range(
        "/supervisor/relaunch_delay_ms", AppConstants::Restart::SELF_RELAUNCH_DELAY_MS,
        AppConstants::Restart::MIN_SELF_RELAUNCH_DELAY_MS,
        AppConstants::Restart::MAX_SELF_RELAUNCH_DELAY_MS));
}

ResilienceController::~ResilienceController() {
    // finish() normally ran already; this covers early returns and test teardown
    uninstall_fault_handlers();
}

bool ResilienceController::set_worker_command(WorkerCommand command) {
    if (m_executor->is_running()) {
        spdlog::warn("[Controller] Cannot replace the worker command while a task runs");
        return false;
    }
    m_executor = std::make_unique<TaskExecutor>(std::move(command));
    m_pending_task.reset();
    return true;
}

// ============================================================================
// Phases
// ============================================================================

int ResilienceController::run() {
    if (start() == InstanceRole::Secondary) {
        return finish();
    }

    spdlog::info("[Controller] Entering main loop");
    while (!m_exit_requested) {
        try {
            step();
        } catch (const std::exception& e) {
            on_fault(e.what());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(AppConstants::Loop::FRAME_DELAY_MS));
    }
    spdlog::info("[Controller] Main loop finished");

    return finish();
}

InstanceRole ResilienceController::start() {
    if (m_role) {
        spdlog::warn("[Controller] start() called twice");
        return *m_role;
    }

    // 1. Single-instance arbitration
    m_role = m_arbiter.acquire();
    if (*m_role == InstanceRole::Secondary) {
        spdlog::info("[Controller] Another instance is running, forwarding {}",
                     m_secondary_intent == ActivationIntent::Show ? "show" : "quit");
        if (!m_arbiter.forward_activation(m_secondary_intent)) {
            spdlog::warn("[Controller] Could not reach the running instance");
        }
        return *m_role;
    }

    spdlog::info("[Controller] Primary instance (PID {}), supervised={}, previous run {}",
                 getpid(), m_startup.launched_by_supervisor,
                 m_startup.previous_run_unclean ? "unclean" : "clean");

    // 2. Crash report of the previous run
    consume_crash_report();

    // 3. Fault and signal handlers
    install_fault_handlers();

    // 4. Liveness marker happens-before the surface exists
    if (!m_marker.stamp()) {
        spdlog::error("[Controller] Could not write liveness marker {}", m_marker.path());
    }

    // 5. Supervisor registration is best effort
    if (!m_installer->install(m_startup.executable_path, m_startup.relaunch_args)) {
        spdlog::warn("[Controller] Supervisor '{}' not installed, continuing without",
                     m_installer->name());
    }

    // 6. Surface
    InitialSurface initial = m_startup.initial_surface();
    spdlog::info("[Controller] Initial surface: {}", initial_surface_name(initial));
    m_lifecycle.start(initial);
    set_status("Idle. Ctrl+T runs the background task, Ctrl+Q exits.");

    if (m_startup.run_task_at_startup) {
        start_background_task();
    }

    return *m_role;
}

void ResilienceController::step() {
    step(m_loop.now());
}

void ResilienceController::step(uint64_t now_ms) {
    std::vector<SurfaceEvent> events;
    m_backend->poll_events(events);
    for (SurfaceEvent event : events) {
        dispatch(event);
    }

    dispatch_signals();
    m_loop.run_once(now_ms);
    poll_task();
}

int ResilienceController::finish() {
    if (m_finished) {
        spdlog::error("[Controller] finish() called twice");
        return exit_code_for(m_classifier.classify_final(m_intent.current()));
    }
    m_finished = true;

    if (m_role && *m_role == InstanceRole::Secondary) {
        return exit_code_for(ExitDisposition::Clean);
    }

    spdlog::info("[Controller] Final teardown (intent {})", quit_intent_name(m_intent.current()));

    if (m_executor->is_running()) {
        m_executor->terminate(AppConstants::Task::TERMINATE_GRACE_MS);
    }
    poll_task();

    m_lifecycle.begin_teardown();

    if (m_intent.is_user_requested()) {
        if (!m_marker.clear()) {
            spdlog::error("[Controller] Could not remove liveness marker {}", m_marker.path());
        }
    } else {
        spdlog::warn("[Controller] Teardown without a requested exit, keeping liveness marker");
    }

    uninstall_fault_handlers();
    m_arbiter.release();

    ExitDisposition disposition = m_classifier.classify_final(m_intent.current());
    int code = exit_code_for(disposition);
    spdlog::info("[Controller] Exit disposition {} (code {})", exit_disposition_name(disposition),
                 code);
    return code;
}

// ============================================================================
// Requests
// ============================================================================

void ResilienceController::request_exit() {
    if (m_intent.record(QuitIntent::UserRequested)) {
        spdlog::info("[Controller] Exit requested by the user");
    }
    if (m_intent.is_user_requested()) {
        m_exit_requested = true;
    }
}

void ResilienceController::request_show() {
    spdlog::debug("[Controller] Show requested");
    m_lifecycle.request_show();
}

bool ResilienceController::start_background_task() {
    if (m_executor->is_running()) {
        spdlog::info("[Controller] Background task already running");
        set_status("A task is already running");
        return false;
    }

    spdlog::info("[Controller] Starting background task: {}", m_executor->command().program);
    m_last_task_result.reset();
    set_status("Task started");
    m_pending_task = m_executor->start_task([this](const OutputLine& line) {
        // Reader thread: hand the line to the loop, touch nothing else
        m_loop.post([this, line]() { on_task_output(line); });
    });

    // Spawn failures resolve immediately
    poll_task();
    return m_pending_task.has_value() || (m_last_task_result && m_last_task_result->success);
}

// ============================================================================
// Fault path
// ============================================================================

void ResilienceController::on_fault(const std::string& reason) {
    spdlog::critical("[Controller] Uncaught controller fault: {}", reason);
    spdlog::dump_backtrace();

    pid_t worker = m_executor->worker_pid();
    if (worker > 0) {
        kill(-worker, SIGKILL);
    }

    if (!m_intent.record(QuitIntent::SystemRequested) && m_intent.is_user_requested()) {
        // The user's exit stands: no relaunch
        spdlog::warn("[Controller] Fault after a requested exit, leaving without relaunch");
        m_marker.clear();
        int code = exit_code_for(m_classifier.classify_final(m_intent.current()));
        spdlog::default_logger()->flush();
        std::_Exit(code);
    }

    if (!m_relaunch_image) {
        m_relaunch_image = std::make_unique<ExecImage>(
            m_startup.executable_path, m_startup.relaunch_args,
            std::vector<std::pair<std::string, std::string>>{{AppConstants::SUPERVISED_ENV, "1"}});
    }
    pid_t relauncher = spawn_delayed_relaunch(*m_relaunch_image, m_relaunch_delay_ms);
    if (relauncher > 0) {
        spdlog::info("[Controller] Relaunch scheduled in {} ms (PID {})", m_relaunch_delay_ms,
                     relauncher);
    } else {
        spdlog::error("[Controller] Could not schedule a relaunch, relying on the supervisor");
    }

    // Marker stays: the relaunched process shows itself
    int code = exit_code_for(m_classifier.classify_final(m_intent.current()));
    spdlog::default_logger()->flush();
    std::_Exit(code);
}

void ResilienceController::terminate_handler() {
    std::string reason = "std::terminate";
    if (std::exception_ptr current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            reason = std::string("uncaught exception: ") + e.what();
        } catch (...) {
            reason = "uncaught non-standard exception";
        }
    }

    if (s_active) {
        s_active->on_fault(reason);
    }
    std::abort();
}

void ResilienceController::install_fault_handlers() {
    if (m_fault_handlers_installed) {
        return;
    }

    m_relaunch_image = std::make_unique<ExecImage>(
        m_startup.executable_path, m_startup.relaunch_args,
        std::vector<std::pair<std::string, std::string>>{{AppConstants::SUPERVISED_ENV, "1"}});

    crash_handler::install(m_paths.crash_file(), m_relaunch_image.get(), m_relaunch_delay_ms);
    signals::install();

    s_active = this;
    m_previous_terminate = std::set_terminate(&ResilienceController::terminate_handler);

    m_loop.set_fault_handler([this](const std::string& reason) { on_fault(reason); });

    m_fault_handlers_installed = true;
}

void ResilienceController::uninstall_fault_handlers() {
    if (!m_fault_handlers_installed) {
        return;
    }

    m_loop.set_fault_handler(nullptr);
    std::set_terminate(m_previous_terminate);
    if (s_active == this) {
        s_active = nullptr;
    }
    signals::uninstall();
    crash_handler::uninstall();

    m_fault_handlers_installed = false;
}

void ResilienceController::consume_crash_report() {
    const std::string path = m_paths.crash_file();
    if (!crash_handler::has_crash_file(path)) {
        return;
    }

    nlohmann::json report = crash_handler::read_crash_file(path);
    if (report.is_null()) {
        spdlog::warn("[Controller] Unreadable crash report at {}, discarding", path);
    } else {
        spdlog::warn("[Controller] Previous run crashed: {} (signal {}), version {}, uptime {}s",
                     report.value("signal_name", "?"), report.value("signal", 0),
                     report.value("app_version", "?"), report.value("uptime_sec", 0L));
        if (report.contains("backtrace")) {
            for (const auto& frame : report["backtrace"]) {
                spdlog::debug("[Controller]   at {}", frame.get<std::string>());
            }
        }
    }
    crash_handler::remove_crash_file(path);
}

// ============================================================================
// Dispatch
// ============================================================================

void ResilienceController::dispatch(SurfaceEvent event) {
    spdlog::trace("[Controller] Surface event {}", surface_event_name(event));

    switch (event) {
    case SurfaceEvent::CloseRequested:
        handle_quit_gesture(m_lifecycle.on_close_requested());
        break;
    case SurfaceEvent::QuitRequested:
        handle_quit_gesture(m_lifecycle.on_quit_requested());
        break;
    case SurfaceEvent::ExitShortcut:
        request_exit();
        break;
    case SurfaceEvent::RunTaskShortcut:
        start_background_task();
        break;
    case SurfaceEvent::ShowShortcut:
        request_show();
        break;
    case SurfaceEvent::SurfaceLost:
        m_lifecycle.on_surface_lost();
        break;
    }
}

void ResilienceController::dispatch_signals() {
    signals::PendingSignals pending = signals::take();
    if (!pending.any()) {
        return;
    }

    // Exit first so a quit signal arriving in the same iteration is not vetoed
    if (pending.exit) {
        spdlog::info("[Controller] SIGUSR2 received");
        request_exit();
    }
    if (pending.quit) {
        spdlog::info("[Controller] Quit signal received");
        handle_quit_gesture(m_lifecycle.on_quit_requested());
    }
    if (pending.show) {
        spdlog::info("[Controller] SIGUSR1 received");
        request_show();
    }
}

void ResilienceController::handle_quit_gesture(bool allowed) {
    // Allowed only once the user asked to exit; vetoed gestures were handled by the lifecycle
    if (allowed) {
        m_exit_requested = true;
    }
}

// ============================================================================
// Background task
// ============================================================================

void ResilienceController::on_task_output(const OutputLine& line) {
    if (line.stream == OutputStream::Stderr) {
        spdlog::warn("[Task] {}", line.text);
    } else {
        spdlog::info("[Task] {}", line.text);
    }
    set_status(line.text);
}

void ResilienceController::poll_task() {
    if (!m_pending_task) {
        return;
    }
    if (m_pending_task->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return;
    }

    // Lines posted by the reader precede the resolution; show them first
    m_loop.drain_posted();

    TaskResult result = m_pending_task->get();
    m_pending_task.reset();

    if (result.success) {
        spdlog::info("[Controller] Background task finished");
        set_status("Task finished");
    } else {
        spdlog::error("[Controller] Background task failed (exit code {}): {}", result.exit_code,
                      result.error);
        set_status("Task failed: " + result.error);
    }
    m_last_task_result = std::move(result);
}

void ResilienceController::set_status(const std::string& text) {
    m_last_status = text;
    m_backend->set_status(text);
}

} // namespace resolute
