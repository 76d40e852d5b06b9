// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "instance_arbiter.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/file.h>
#include <thread>
#include <unistd.h>

namespace resolute {

namespace {

constexpr int ACQUIRE_ATTEMPTS = 3;
constexpr int ACQUIRE_RETRY_MS = 50;

} // namespace

// ============================================================================
// InstanceLock
// ============================================================================

InstanceLock::InstanceLock(std::string path) : path_(std::move(path)) {}

InstanceLock::~InstanceLock() {
    release();
}

bool InstanceLock::try_acquire() {
    if (fd_ >= 0) {
        return true;
    }

    int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        spdlog::error("[InstanceLock] Cannot open {}: {}", path_, strerror(errno));
        return false;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno != EWOULDBLOCK) {
            spdlog::error("[InstanceLock] flock({}) failed: {}", path_, strerror(errno));
        }
        close(fd);
        return false;
    }

    std::string pid_line = std::to_string(getpid()) + "\n";
    if (ftruncate(fd, 0) != 0 ||
        pwrite(fd, pid_line.data(), pid_line.size(), 0) != static_cast<ssize_t>(pid_line.size())) {
        // Still the lock holder; others just can't find our PID
        spdlog::warn("[InstanceLock] Cannot record PID in {}: {}", path_, strerror(errno));
    }

    fd_ = fd;
    spdlog::debug("[InstanceLock] Acquired {} (PID {})", path_, getpid());
    return true;
}

void InstanceLock::release() {
    if (fd_ < 0) {
        return;
    }
    // Leave the file in place: unlinking would let a new holder lock a
    // different inode while an old reader still has this one open
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
    spdlog::debug("[InstanceLock] Released {}", path_);
}

std::optional<pid_t> InstanceLock::read_holder_pid(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return std::nullopt;
    }
    char buf[32] = {};
    ssize_t n = read(fd, buf, sizeof(buf) - 1);
    close(fd);
    if (n <= 0) {
        return std::nullopt;
    }
    char* end = nullptr;
    long pid = std::strtol(buf, &end, 10);
    if (end == buf || pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool InstanceLock::is_locked(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    bool locked = false;
    if (flock(fd, LOCK_SH | LOCK_NB) != 0) {
        locked = (errno == EWOULDBLOCK);
    } else {
        flock(fd, LOCK_UN);
    }
    close(fd);
    return locked;
}

// ============================================================================
// InstanceArbiter
// ============================================================================

const char* instance_role_name(InstanceRole role) {
    return role == InstanceRole::Primary ? "Primary" : "Secondary";
}

int activation_signal(ActivationIntent intent) {
    return intent == ActivationIntent::Show ? SIGUSR1 : SIGUSR2;
}

InstanceArbiter::InstanceArbiter(std::string lock_path) : lock_(std::move(lock_path)) {}

InstanceRole InstanceArbiter::acquire() {
    for (int attempt = 0; attempt < ACQUIRE_ATTEMPTS; ++attempt) {
        if (attempt > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ACQUIRE_RETRY_MS));
        }
        if (lock_.try_acquire()) {
            spdlog::info("[Arbiter] Primary instance (lock {})", lock_.path());
            return InstanceRole::Primary;
        }
    }

    auto holder = InstanceLock::read_holder_pid(lock_.path());
    spdlog::info("[Arbiter] Secondary instance (primary PID {})",
                 holder ? std::to_string(*holder) : std::string("unknown"));
    return InstanceRole::Secondary;
}

bool InstanceArbiter::forward_activation(ActivationIntent intent) const {
    auto holder = InstanceLock::read_holder_pid(lock_.path());
    if (!holder) {
        spdlog::error("[Arbiter] Cannot read primary PID from {}", lock_.path());
        return false;
    }

    int sig = activation_signal(intent);
    if (kill(*holder, sig) != 0) {
        spdlog::error("[Arbiter] Cannot signal primary PID {}: {}", *holder, strerror(errno));
        return false;
    }

    spdlog::info("[Arbiter] Forwarded {} to PID {}",
                 intent == ActivationIntent::Show ? "show" : "quit", *holder);
    return true;
}

void InstanceArbiter::release() {
    lock_.release();
}

bool forward_to_running_instance(const std::string& lock_path, ActivationIntent intent) {
    if (!InstanceLock::is_locked(lock_path)) {
        return false;
    }
    InstanceArbiter arbiter(lock_path);
    if (!arbiter.forward_activation(intent)) {
        spdlog::warn("[Arbiter] A primary holds {} but could not be signalled", lock_path);
    }
    return true;
}

} // namespace resolute
