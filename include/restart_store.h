// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file restart_store.h
 * @brief Small key/value store used to coordinate restarts across processes
 *
 * Each key is one file in the state directory. Several processes may touch
 * the same key (the app, its relaunched successor, the watchdog), so:
 * - writes go to a temp file and are renamed into place, readers never see a
 *   partial value;
 * - every read failure, including a file removed between an existence check
 *   and the read, is reported as "absent".
 */

#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace resolute {

class RestartStore {
  public:
    explicit RestartStore(std::string directory);

    std::optional<std::string> read(const std::string& key) const;
    bool write(const std::string& key, const std::string& value) const;

    /**
     * @brief Remove a key
     * @return true if the key is gone afterwards (including "was never there")
     */
    bool clear(const std::string& key) const;

    bool exists(const std::string& key) const;

    std::string path_for(const std::string& key) const;

    const std::string& directory() const {
        return directory_;
    }

  private:
    std::string directory_;
};

/**
 * @brief The restart marker: present while a run is live
 *
 * Stamped at startup, removed only on a sanctioned clean exit. Finding it at
 * the next startup means the previous run ended without clean teardown.
 */
class LivenessMarker {
  public:
    static constexpr const char* KEY = "liveness";

    explicit LivenessMarker(const RestartStore& store) : store_(store) {}

    bool present() const;

    /// Write the current Unix time
    bool stamp() const;

    bool clear() const;

    /// Timestamp stored in the marker, if present and parseable
    std::optional<std::time_t> written_at() const;

    std::string path() const {
        return store_.path_for(KEY);
    }

  private:
    const RestartStore& store_;
};

} // namespace resolute
