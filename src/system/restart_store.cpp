// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "restart_store.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace resolute {

RestartStore::RestartStore(std::string directory) : directory_(std::move(directory)) {}

std::string RestartStore::path_for(const std::string& key) const {
    return directory_ + "/" + key;
}

std::optional<std::string> RestartStore::read(const std::string& key) const {
    std::ifstream in(path_for(key));
    if (!in.good()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

bool RestartStore::write(const std::string& key, const std::string& value) const {
    std::string path = path_for(key);
    std::string tmp_path = path + ".tmp." + std::to_string(getpid());
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.good()) {
            spdlog::warn("[RestartStore] Cannot write {}: {}", tmp_path, strerror(errno));
            return false;
        }
        out << value;
        out.flush();
        if (!out.good()) {
            spdlog::warn("[RestartStore] Short write to {}", tmp_path);
            std::remove(tmp_path.c_str());
            return false;
        }
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        spdlog::warn("[RestartStore] Cannot rename {} -> {}: {}", tmp_path, path, strerror(errno));
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

bool RestartStore::clear(const std::string& key) const {
    std::string path = path_for(key);
    if (unlink(path.c_str()) == 0 || errno == ENOENT) {
        return true;
    }
    spdlog::warn("[RestartStore] Cannot remove {}: {}", path, strerror(errno));
    return false;
}

bool RestartStore::exists(const std::string& key) const {
    struct stat st;
    return stat(path_for(key).c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

// ============================================================================
// LivenessMarker
// ============================================================================

bool LivenessMarker::present() const {
    return store_.exists(KEY);
}

bool LivenessMarker::stamp() const {
    return store_.write(KEY, std::to_string(static_cast<long long>(std::time(nullptr))) + "\n");
}

bool LivenessMarker::clear() const {
    return store_.clear(KEY);
}

std::optional<std::time_t> LivenessMarker::written_at() const {
    auto value = store_.read(KEY);
    if (!value) {
        return std::nullopt;
    }
    try {
        return static_cast<std::time_t>(std::stoll(*value));
    } catch (const std::exception&) {
        spdlog::debug("[RestartStore] Unparseable liveness marker: '{}'", *value);
        return std::nullopt;
    }
}

} // namespace resolute
