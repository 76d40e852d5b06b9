// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file instance_arbiter.h
 * @brief Single-instance arbitration via flock() on a PID file
 *
 * The lock lives as long as the file descriptor, so the kernel releases it
 * however the holder dies. The holder writes its PID into the file so other
 * processes (second instances, the watchdog) know whom to signal.
 */

#pragma once

#include <optional>
#include <string>
#include <sys/types.h>

namespace resolute {

/**
 * @brief Exclusive advisory lock on a file that records the holder's PID
 *
 * Used for both the instance lock and the watchdog lock. The descriptor is
 * opened O_CLOEXEC so spawned workers never inherit the lock.
 */
class InstanceLock {
  public:
    explicit InstanceLock(std::string path);
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    /**
     * @brief Try to take the lock without blocking
     *
     * On success the file contains this process's PID.
     *
     * @return true if this object now holds the lock
     */
    bool try_acquire();

    /// Drop the lock (no-op when not held)
    void release();

    bool held() const {
        return fd_ >= 0;
    }

    const std::string& path() const {
        return path_;
    }

    /**
     * @brief PID recorded in a lock file
     * @return nullopt if the file is missing, empty or unparseable
     */
    static std::optional<pid_t> read_holder_pid(const std::string& path);

    /**
     * @brief Whether some open file description currently holds the lock
     *
     * Probes with a short-lived shared lock. A holder inside this process
     * counts as well.
     */
    static bool is_locked(const std::string& path);

  private:
    std::string path_;
    int fd_ = -1;
};

enum class InstanceRole { Primary, Secondary };

/**
 * @brief What a second launch asks the primary to do
 */
enum class ActivationIntent {
    Show, ///< SIGUSR1
    Quit, ///< SIGUSR2 (sanctioned exit)
};

const char* instance_role_name(InstanceRole role);

/// POSIX signal that carries an activation intent
int activation_signal(ActivationIntent intent);

/**
 * @brief Decides whether this process is the primary instance
 */
class InstanceArbiter {
  public:
    explicit InstanceArbiter(std::string lock_path);

    /**
     * @brief Try to become the primary instance
     *
     * A few quick retries absorb a short check (watchdog, --quit) that holds the
     * lock for a moment.
     */
    InstanceRole acquire();

    /**
     * @brief Deliver an activation intent to the primary
     *
     * Failures (no PID recorded, signal not delivered) are logged.
     *
     * @return true if the signal was delivered
     */
    bool forward_activation(ActivationIntent intent) const;

    /// Release the instance lock early (it is released on exit anyway)
    void release();

    bool is_primary() const {
        return lock_.held();
    }

    const std::string& lock_path() const {
        return lock_.path();
    }

  private:
    InstanceLock lock_;
};

/**
 * @brief Early secondary path: signal a running primary before any startup work
 *
 * Only reads the lock file; creates nothing.
 *
 * @return true if a primary holds the lock (the caller should exit clean)
 */
bool forward_to_running_instance(const std::string& lock_path, ActivationIntent intent);

} // namespace resolute
