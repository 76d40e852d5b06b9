// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "runtime_paths.h"

#include "app_constants.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace resolute {

namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return value;
    }
    return {};
}

/// $<xdg_var>/resolute, or $HOME/<home_suffix>/resolute, or /tmp/resolute-<uid>
std::string xdg_dir(const char* xdg_var, const char* home_suffix) {
    std::string base = env_or_empty(xdg_var);
    if (base.empty()) {
        std::string home = env_or_empty("HOME");
        if (home.empty()) {
            return "/tmp/resolute-" + std::to_string(getuid());
        }
        base = home + "/" + home_suffix;
    }
    return base + "/resolute";
}

} // namespace

RuntimePaths RuntimePaths::under(const std::string& root) {
    RuntimePaths paths;
    paths.config_dir = root + "/config";
    paths.state_dir = root + "/state";
    paths.runtime_dir = root + "/run";
    paths.data_dir = root + "/data";
    return paths;
}

RuntimePaths RuntimePaths::resolve() {
    std::string root = env_or_empty(AppConstants::HOME_OVERRIDE_ENV);
    if (!root.empty()) {
        return under(root);
    }

    RuntimePaths paths;
    paths.config_dir = xdg_dir("XDG_CONFIG_HOME", ".config");
    paths.state_dir = xdg_dir("XDG_STATE_HOME", ".local/state");
    paths.data_dir = xdg_dir("XDG_DATA_HOME", ".local/share");

    // XDG_RUNTIME_DIR has no HOME fallback; share the state directory instead
    std::string runtime = env_or_empty("XDG_RUNTIME_DIR");
    paths.runtime_dir = runtime.empty() ? paths.state_dir : runtime + "/resolute";
    return paths;
}

bool RuntimePaths::ensure_directories() const {
    bool ok = true;
    for (const std::string* dir : {&config_dir, &state_dir, &runtime_dir, &data_dir}) {
        std::error_code ec;
        fs::create_directories(*dir, ec);
        if (ec) {
            spdlog::error("[RuntimePaths] Cannot create {}: {}", *dir, ec.message());
            ok = false;
            continue;
        }
        fs::permissions(*dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    }
    return ok;
}

} // namespace resolute
