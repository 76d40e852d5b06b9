// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "instance_arbiter.h"

#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <sys/wait.h>
#include <unistd.h>

using namespace resolute;
using resolute::test::TempDirFixture;
using resolute::test::wait_child;
using resolute::test::wait_until;

namespace {

constexpr int EXIT_GOT_SHOW = 10;
constexpr int EXIT_GOT_QUIT = 20;

/**
 * @brief Child holding the instance lock until SIGUSR1/SIGUSR2 arrives
 *
 * Exits with EXIT_GOT_SHOW or EXIT_GOT_QUIT so the parent can tell which
 * activation was delivered.
 */
pid_t spawn_lock_holder(const std::string& lock_path) {
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

class InstanceArbiterFixture : public TempDirFixture {
  protected:
    std::string lock_path() const {
        return paths.instance_lock_file();
    }
};

// ============================================================================
// InstanceLock
// ============================================================================

TEST_CASE_METHOD(InstanceArbiterFixture, "InstanceLock: first holder wins",
                 "[core][arbiter]") {
    InstanceLock first(lock_path());
    InstanceLock second(lock_path());

    REQUIRE(first.try_acquire());
    REQUIRE(first.held());
    REQUIRE_FALSE(second.try_acquire());
    REQUIRE_FALSE(second.held());

    first.release();
    REQUIRE(second.try_acquire());
}

TEST_CASE_METHOD(InstanceArbiterFixture, "InstanceLock: holder records its PID", "[arbiter]") {
    InstanceLock lock(lock_path());
    REQUIRE(lock.try_acquire());

    auto pid = InstanceLock::read_holder_pid(lock_path());
    REQUIRE(pid.has_value());
    REQUIRE(*pid == getpid());
    REQUIRE(InstanceLock::is_locked(lock_path()));

    lock.release();
    REQUIRE_FALSE(InstanceLock::is_locked(lock_path()));
}

TEST_CASE_METHOD(InstanceArbiterFixture, "InstanceLock: missing or garbage file reads as absent",
                 "[arbiter]") {
    REQUIRE_FALSE(InstanceLock::read_holder_pid(lock_path()).has_value());
    REQUIRE_FALSE(InstanceLock::is_locked(lock_path()));

    write_file("run/instance.lock", "garbage");
    REQUIRE_FALSE(InstanceLock::read_holder_pid(lock_path()).has_value());
}

TEST_CASE_METHOD(InstanceArbiterFixture, "InstanceLock: released when the holder dies",
                 "[core][arbiter]") {
    pid_t child = fork();
    if (child == 0) {
        InstanceLock lock(lock_path());
        // No release(): the kernel drops the lock with the process
        _exit(lock.try_acquire() ? 0 : 1);
    }
    int status = wait_child(child, 5000);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 0);

    InstanceLock lock(lock_path());
    REQUIRE(lock.try_acquire());
}

// ============================================================================
// InstanceArbiter
// ============================================================================

TEST_CASE_METHOD(InstanceArbiterFixture, "InstanceArbiter: single launch is primary",
                 "[core][arbiter]") {
    InstanceArbiter arbiter(lock_path());
    REQUIRE(arbiter.acquire() == InstanceRole::Primary);
    REQUIRE(arbiter.is_primary());

    InstanceArbiter other(lock_path());
    REQUIRE(other.acquire() == InstanceRole::Secondary);
    REQUIRE_FALSE(other.is_primary());
}

TEST_CASE_METHOD(InstanceArbiterFixture, "InstanceArbiter: secondary forwards show",
                 "[core][arbiter]") {
    pid_t holder = spawn_lock_holder(lock_path());
    REQUIRE(wait_until([&]() { return InstanceLock::read_holder_pid(lock_path()) == holder; },
                       5000));

    InstanceArbiter arbiter(lock_path());
    REQUIRE(arbiter.acquire() == InstanceRole::Secondary);
    REQUIRE(arbiter.forward_activation(ActivationIntent::Show));

    int status = wait_child(holder, 5000);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == EXIT_GOT_SHOW);
}

TEST_CASE_METHOD(InstanceArbiterFixture, "InstanceArbiter: --quit forwards the sanctioned exit",
                 "[arbiter]") {
    pid_t holder = spawn_lock_holder(lock_path());
    REQUIRE(wait_until([&]() { return InstanceLock::read_holder_pid(lock_path()) == holder; },
                       5000));

    InstanceArbiter arbiter(lock_path());
    REQUIRE(arbiter.forward_activation(ActivationIntent::Quit));

    int status = wait_child(holder, 5000);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == EXIT_GOT_QUIT);
}

TEST_CASE_METHOD(InstanceArbiterFixture, "InstanceArbiter: forwarding without a primary fails",
                 "[arbiter]") {
    InstanceArbiter arbiter(lock_path());
    REQUIRE_FALSE(arbiter.forward_activation(ActivationIntent::Show));
}

TEST_CASE("InstanceArbiter: activation signals", "[arbiter]") {
    REQUIRE(activation_signal(ActivationIntent::Show) == SIGUSR1);
    REQUIRE(activation_signal(ActivationIntent::Quit) == SIGUSR2);
}

// ============================================================================
// Early forwarding
// ============================================================================

TEST_CASE_METHOD(InstanceArbiterFixture, "forward_to_running_instance: no primary touches nothing",
                 "[arbiter]") {
    std::string missing = path("never-created/instance.lock");

    REQUIRE_FALSE(forward_to_running_instance(missing, ActivationIntent::Show));
    REQUIRE_FALSE(file_exists("never-created/instance.lock"));
    REQUIRE_FALSE(file_exists("never-created"));
}

TEST_CASE_METHOD(InstanceArbiterFixture, "forward_to_running_instance: signals the primary",
                 "[arbiter]") {
    pid_t holder = spawn_lock_holder(lock_path());
    REQUIRE(wait_until([&]() { return InstanceLock::read_holder_pid(lock_path()) == holder; },
                       5000));

    REQUIRE(forward_to_running_instance(lock_path(), ActivationIntent::Quit));

    int status = wait_child(holder, 5000);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == EXIT_GOT_QUIT);
}
