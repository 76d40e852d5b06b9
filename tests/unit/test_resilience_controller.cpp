// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_resilience_controller.cpp
 * @brief End-to-end tests of the controller with a mock surface and fake ticks
 *
 * Fault-path tests run the controller in a forked child because on_fault()
 * ends the process.
 */

#include "resilience_controller.h"

#include "../test_fixtures.h"
#include "app_constants.h"
#include "supervisor_installer.h"
#include "surface_backend_mock.h"

#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <fstream>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

using namespace resolute;
using namespace resolute::test;

namespace {

constexpr int EXIT_GOT_SHOW = 10;
constexpr int EXIT_GOT_QUIT = 20;

/// Child holding the instance lock until SIGUSR1/SIGUSR2 arrives
pid_t spawn_primary(const std::string& lock_path) {
    pid_t pid = fork();
    if (pid == 0) {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGUSR1);
        sigaddset(&set, SIGUSR2);
        sigprocmask(SIG_BLOCK, &set, nullptr);

        InstanceLock lock(lock_path);
        if (!lock.try_acquire()) {
            _exit(1);
        }
        int sig = 0;
        sigwait(&set, &sig);
        _exit(sig == SIGUSR1 ? EXIT_GOT_SHOW : EXIT_GOT_QUIT);
    }
    return pid;
}

} // namespace

class ControllerFixture : public TempDirFixture {
  protected:
    ControllerFixture() {
        startup.executable_path = "/bin/true";
        config.set<int>("/lifecycle/close_reshow_delay_ms", 2000);
    }

    ResilienceController& make_controller() {
        auto backend = std::make_unique<SurfaceBackendMock>();
        mock = backend.get();
        controller = std::make_unique<ResilienceController>(
            startup, config, paths, std::move(backend), nullptr, [this]() { return now_ms; });
        return *controller;
    }

    /// One iteration at the current fake time
    void step() {
        controller->step(now_ms);
    }

    void advance(uint64_t ms) {
        now_ms += ms;
        step();
    }

    bool marker_on_disk() const {
        RestartStore store(paths.state_dir);
        return LivenessMarker(store).present();
    }

    /// Step until the task resolves (real time: the worker is a real process)
    bool wait_for_task() {
        return wait_until(
            [this]() {
                step();
                return controller->last_task_result().has_value();
            },
            5000);
    }

    Config config;
    StartupConfig startup;
    uint64_t now_ms = 1000;
    SurfaceBackendMock* mock = nullptr;
    std::unique_ptr<ResilienceController> controller;
};

// ============================================================================
// Startup
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "Controller: primary startup stamps marker and shows window",
                 "[controller]") {
    auto& c = make_controller();

    REQUIRE(c.start() == InstanceRole::Primary);
    REQUIRE(c.arbiter().is_primary());
    REQUIRE(marker_on_disk());
    REQUIRE(c.lifecycle().state() == SurfaceState::Visible);
    REQUIRE(mock->visible());
    REQUIRE_FALSE(mock->status().empty());
    REQUIRE(c.intent().current() == QuitIntent::Unknown);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: supervisor relaunch picks the initial surface",
                 "[controller][startup]") {
    startup.launched_by_supervisor = true;

    SECTION("previous run died: visible") {
        startup.previous_run_unclean = true;
        auto& c = make_controller();
        c.start();
        REQUIRE(c.lifecycle().state() == SurfaceState::Visible);
    }

    SECTION("previous run was clean: headless") {
        startup.previous_run_unclean = false;
        auto& c = make_controller();
        c.start();
        REQUIRE(c.lifecycle().state() == SurfaceState::Headless);
        REQUIRE_FALSE(mock->visible());

        // Still stamps the marker
        REQUIRE(marker_on_disk());
    }
}

TEST_CASE_METHOD(ControllerFixture, "Controller: crash report of the previous run is consumed",
                 "[controller][startup]") {
    {
        std::ofstream out(paths.crash_file());
        out << "signal:11\nname:SIGSEGV\nversion:0.4.0\n";
    }

    auto& c = make_controller();
    c.start();

    std::ifstream in(paths.crash_file());
    REQUIRE_FALSE(in.good());
}

TEST_CASE_METHOD(ControllerFixture, "Controller: secondary forwards its intent and exits clean",
                 "[controller][arbiter]") {
    pid_t primary = spawn_primary(paths.instance_lock_file());
    REQUIRE(wait_until([this]() { return InstanceLock::is_locked(paths.instance_lock_file()); },
                       2000));

    auto& c = make_controller();

    SECTION("show") {
        REQUIRE(c.start() == InstanceRole::Secondary);
        REQUIRE(c.finish() == 0);

        int status = wait_child(primary, 2000);
        REQUIRE(WIFEXITED(status));
        REQUIRE(WEXITSTATUS(status) == EXIT_GOT_SHOW);
    }

    SECTION("quit") {
        c.set_secondary_intent(ActivationIntent::Quit);
        REQUIRE(c.start() == InstanceRole::Secondary);
        REQUIRE(c.finish() == 0);

        int status = wait_child(primary, 2000);
        REQUIRE(WIFEXITED(status));
        REQUIRE(WEXITSTATUS(status) == EXIT_GOT_QUIT);
    }

    // A secondary never touches the marker or the surface
    REQUIRE_FALSE(marker_on_disk());
    REQUIRE(mock->create_count == 0);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: killed run resurfaces under the supervisor",
                 "[controller][startup][slow]") {
    pid_t pid = fork_child([this]() {
        auto& c = make_controller();
        c.start();
        pause();
        return 0;
    });

    REQUIRE(wait_until([this]() { return marker_on_disk(); }, 5000));
    kill(pid, SIGKILL);
    int status = wait_child(pid, 5000);
    REQUIRE(WIFSIGNALED(status));

    // What the watchdog's relaunch finds at startup
    startup.launched_by_supervisor = true;
    startup.previous_run_unclean = marker_on_disk();
    REQUIRE(startup.previous_run_unclean);

    auto& c = make_controller();
    REQUIRE(c.start() == InstanceRole::Primary);
    REQUIRE(c.lifecycle().state() == SurfaceState::Visible);
    REQUIRE(mock->visible());
}

// ============================================================================
// Quit gestures
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "Controller: exit shortcut ends the run clean",
                 "[controller][exit]") {
    auto& c = make_controller();
    c.start();

    mock->inject(SurfaceEvent::ExitShortcut);
    step();

    REQUIRE(c.exit_requested());
    REQUIRE(c.intent().is_user_requested());
    REQUIRE(c.finish() == 0);
    REQUIRE_FALSE(marker_on_disk());
    REQUIRE(mock->destroy_count == 1);
    REQUIRE_FALSE(c.arbiter().is_primary());
}

TEST_CASE_METHOD(ControllerFixture, "Controller: close is vetoed and the window comes back",
                 "[controller][veto]") {
    auto& c = make_controller();
    c.start();

    mock->inject(SurfaceEvent::CloseRequested);
    step();

    REQUIRE_FALSE(c.exit_requested());
    REQUIRE(c.lifecycle().state() == SurfaceState::Hidden);
    REQUIRE_FALSE(mock->visible());

    advance(1999);
    REQUIRE(c.lifecycle().state() == SurfaceState::Hidden);

    advance(1);
    REQUIRE(c.lifecycle().state() == SurfaceState::Visible);
    REQUIRE(mock->visible());
}

TEST_CASE_METHOD(ControllerFixture, "Controller: close after the exit control is allowed",
                 "[controller][exit]") {
    auto& c = make_controller();
    c.start();

    c.request_exit();
    mock->inject(SurfaceEvent::CloseRequested);
    step();

    REQUIRE(c.exit_requested());
    REQUIRE(c.finish() == 0);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: finish without a requested exit is abnormal",
                 "[controller][exit]") {
    auto& c = make_controller();
    c.start();

    REQUIRE(c.finish() == 1);
    REQUIRE(marker_on_disk());

    // The first answer stands
    REQUIRE(c.finish() == 1);
}

// ============================================================================
// Process signals
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "Controller: process signals", "[controller][signals]") {
    auto& c = make_controller();
    c.start();

    SECTION("SIGUSR1 shows a hidden window") {
        mock->inject(SurfaceEvent::CloseRequested);
        step();
        REQUIRE(c.lifecycle().state() == SurfaceState::Hidden);

        raise(SIGUSR1);
        step();
        REQUIRE(c.lifecycle().state() == SurfaceState::Visible);
    }

    SECTION("SIGUSR1 raises a visible window") {
        int before = mock->raise_count;
        raise(SIGUSR1);
        step();
        REQUIRE(mock->raise_count == before + 1);
    }

    SECTION("SIGTERM is vetoed") {
        raise(SIGTERM);
        step();
        REQUIRE_FALSE(c.exit_requested());
        REQUIRE(c.intent().current() == QuitIntent::Unknown);
    }

    SECTION("SIGUSR2 is the sanctioned exit") {
        raise(SIGUSR2);
        step();
        REQUIRE(c.exit_requested());
        REQUIRE(c.finish() == 0);
        REQUIRE_FALSE(marker_on_disk());
    }
}

// ============================================================================
// Background task
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "Controller: background task reports progress",
                 "[controller][task]") {
    auto& c = make_controller();
    c.start();

    SECTION("success") {
        REQUIRE(c.set_worker_command({"/bin/sh", {"-c", "echo step one; echo step two"}, {}}));
        REQUIRE(c.start_background_task());
        REQUIRE(wait_for_task());

        REQUIRE(c.last_task_result()->success);
        REQUIRE(c.last_status() == "Task finished");
        REQUIRE(mock->status() == "Task finished");
    }

    SECTION("failure") {
        REQUIRE(c.set_worker_command({"/bin/sh", {"-c", "echo broken >&2; exit 3"}, {}}));
        REQUIRE(c.start_background_task());
        REQUIRE(wait_for_task());

        REQUIRE_FALSE(c.last_task_result()->success);
        REQUIRE(c.last_task_result()->exit_code == 3);
        REQUIRE(c.last_status().rfind("Task failed", 0) == 0);
    }

    SECTION("missing worker") {
        REQUIRE(c.set_worker_command({path("no-such-worker"), {}, {}}));
        REQUIRE_FALSE(c.start_background_task());
        REQUIRE(c.last_task_result().has_value());
        REQUIRE_FALSE(c.last_task_result()->success);
    }

    // The loop keeps running with the task settled
    REQUIRE_FALSE(c.exit_requested());
    REQUIRE(c.lifecycle().state() == SurfaceState::Visible);
}

TEST_CASE_METHOD(ControllerFixture, "Controller: second task start is rejected while one runs",
                 "[controller][task]") {
    auto& c = make_controller();
    c.start();

    REQUIRE(c.set_worker_command({"/bin/sh", {"-c", "sleep 10"}, {}}));
    REQUIRE(c.start_background_task());
    REQUIRE(c.executor().is_running());

    mock->inject(SurfaceEvent::RunTaskShortcut);
    step();
    REQUIRE(c.last_status() == "A task is already running");
    REQUIRE_FALSE(c.set_worker_command({"/bin/true", {}, {}}));

    // Teardown stops the worker
    c.request_exit();
    REQUIRE(c.finish() == 0);
    REQUIRE_FALSE(c.executor().is_running());
}

TEST_CASE_METHOD(ControllerFixture, "Controller: worker command comes from config or sibling",
                 "[controller][task]") {
    SECTION("sibling of the executable") {
        WorkerCommand command =
            ResilienceController::default_worker_command(config, "/opt/resolute/bin/resolute");
        REQUIRE(command.program == "/opt/resolute/bin/resolute-worker");
    }

    SECTION("config override") {
        config.set<std::string>("/worker/path", "/usr/libexec/custom-worker");
        WorkerCommand command =
            ResilienceController::default_worker_command(config, "/opt/resolute/bin/resolute");
        REQUIRE(command.program == "/usr/libexec/custom-worker");
    }
}

TEST_CASE_METHOD(ControllerFixture, "Controller: relaunch delay from config is kept in range",
                 "[controller][config]") {
    SECTION("negative") {
        config.set<int>("/supervisor/relaunch_delay_ms", -1);
        REQUIRE(make_controller().relaunch_delay_ms() ==
                AppConstants::Restart::MIN_SELF_RELAUNCH_DELAY_MS);
    }

    SECTION("below the minimum") {
        config.set<int>("/supervisor/relaunch_delay_ms", 10);
        REQUIRE(make_controller().relaunch_delay_ms() ==
                AppConstants::Restart::MIN_SELF_RELAUNCH_DELAY_MS);
    }

    SECTION("absurdly large") {
        config.set<int64_t>("/supervisor/relaunch_delay_ms", 4294967295LL);
        REQUIRE(make_controller().relaunch_delay_ms() ==
                AppConstants::Restart::MAX_SELF_RELAUNCH_DELAY_MS);
    }

    SECTION("in range") {
        config.set<int>("/supervisor/relaunch_delay_ms", 2500);
        REQUIRE(make_controller().relaunch_delay_ms() == 2500);
    }
}

#ifdef RESOLUTE_WORKER_PATH
TEST_CASE_METHOD(ControllerFixture, "Controller: real worker runs to completion",
                 "[controller][task][slow]") {
    auto& c = make_controller();
    c.start();

    REQUIRE(c.set_worker_command({RESOLUTE_WORKER_PATH, {}, {{"RESOLUTE_WORKER_SCALE", "5"}}}));
    REQUIRE(c.start_background_task());
    REQUIRE(wait_until(
        [&]() {
            step();
            return c.last_task_result().has_value();
        },
        30000));
    REQUIRE(c.last_task_result()->success);
}
#endif

// ============================================================================
// Fault path
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "Controller: loop fault relaunches and exits abnormally",
                 "[controller][fault][slow]") {
    std::string relaunched = path("relaunched");
    startup.executable_path = "/bin/sh";
    startup.relaunch_args = {"-c", "echo \"$RESOLUTE_SUPERVISED\" > '" + relaunched + "'"};

    pid_t pid = fork_child([this]() {
        auto& c = make_controller();
        c.start();
        c.loop().post([]() { throw std::runtime_error("callback blew up"); });
        step();
        // Not reached: the fault ends the process
        return 99;
    });

    int status = wait_child(pid, 5000);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 1);

    // The marker survives so the relaunch shows itself
    REQUIRE(marker_on_disk());

    REQUIRE(wait_until([this]() { return file_exists("relaunched"); }, 5000));
    REQUIRE(wait_until([this]() { return read_file("relaunched") == "1\n"; }, 1000));
}

TEST_CASE_METHOD(ControllerFixture, "Controller: fault after the exit control stays exited",
                 "[controller][fault]") {
    startup.executable_path = "/bin/sh";
    startup.relaunch_args = {"-c", "touch '" + path("relaunched") + "'"};

    pid_t pid = fork_child([this]() {
        auto& c = make_controller();
        c.start();
        c.request_exit();
        c.on_fault("late fault");
        return 99;
    });

    int status = wait_child(pid, 5000);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 0);
    REQUIRE_FALSE(marker_on_disk());

    // Relaunch delay is at least one second; nothing may appear
    usleep(1500 * 1000);
    REQUIRE_FALSE(file_exists("relaunched"));
}
