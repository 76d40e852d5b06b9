// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "app_constants.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace resolute {

namespace {

/// Copy every key of `defaults` missing from `target`, recursing into objects
/// @return true if anything was added
bool merge_missing(json& target, const json& defaults) {
    bool changed = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key())) {
            target[it.key()] = it.value();
            changed = true;
        } else if (it.value().is_object() && target[it.key()].is_object()) {
            changed |= merge_missing(target[it.key()], it.value());
        }
    }
    return changed;
}

} // namespace

Config::Config() : data(default_config()) {}

json Config::default_config() {
    return {{"lifecycle",
             {{"persistent_background", false},
              {"close_reshow_delay_ms", AppConstants::Lifecycle::CLOSE_RESHOW_DELAY_MS},
              {"recreate_delay_ms", AppConstants::Lifecycle::RECREATE_DELAY_MS}}},
            {"supervisor",
             {{"enabled", true},
              {"restart_delay_sec", AppConstants::Restart::SUPERVISOR_DELAY_SEC},
              {"relaunch_delay_ms", AppConstants::Restart::SELF_RELAUNCH_DELAY_MS}}},
            {"worker", {{"path", ""}}},
            {"display",
             {{"backend", "auto"},
              {"width", AppConstants::Display::DEFAULT_WIDTH},
              {"height", AppConstants::Display::DEFAULT_HEIGHT}}},
            {"log_level", "warn"},
            {"log_dest", "auto"}};
}

bool Config::init(const std::string& config_path) {
    path = config_path;
    data = default_config();

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::info("[Config] No config at {}, writing defaults", path);
        save();
        return false;
    }

    try {
        std::ifstream file(path);
        json loaded = json::parse(file);
        if (!loaded.is_object()) {
            throw std::runtime_error("top-level value is not an object");
        }
        if (merge_missing(loaded, default_config())) {
            spdlog::debug("[Config] Added missing keys from defaults");
            data = std::move(loaded);
            save();
        } else {
            data = std::move(loaded);
        }
        spdlog::debug("[Config] Loaded {}", path);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("[Config] Failed to parse {}: {} - using defaults", path, e.what());
        data = default_config();
        save();
        return false;
    }
}

int64_t Config::get_in_range(const std::string& json_ptr, int64_t default_value,
                             int64_t min_value, int64_t max_value) const {
    int64_t value = get<int64_t>(json_ptr, default_value);
    if (value < min_value || value > max_value) {
        int64_t clamped = value < min_value ? min_value : max_value;
        spdlog::warn("[Config] {} = {} is outside [{}, {}], using {}", json_ptr, value, min_value,
                     max_value, clamped);
        return clamped;
    }
    return value;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() const {
    if (path.empty()) {
        spdlog::warn("[Config] save() called before init()");
        return false;
    }

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);

    std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.good()) {
            spdlog::error("[Config] Cannot write {}", tmp_path);
            return false;
        }
        out << data.dump(2) << '\n';
        if (!out.good()) {
            spdlog::error("[Config] Short write to {}", tmp_path);
            return false;
        }
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        spdlog::error("[Config] Cannot replace {}", path);
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

} // namespace resolute
