// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "startup_config.h"

#include "app_constants.h"
#include "cli_args.h"
#include "restart_store.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <strings.h>

namespace fs = std::filesystem;

namespace resolute {

const char* initial_surface_name(InitialSurface surface) {
    return surface == InitialSurface::Visible ? "Visible" : "Headless";
}

bool parse_env_flag(const char* value) {
    if (!value) {
        return false;
    }
    return strcmp(value, "1") == 0 || strcasecmp(value, "true") == 0 ||
           strcasecmp(value, "yes") == 0 || strcasecmp(value, "on") == 0;
}

std::string current_executable_path(const char* argv0) {
    std::error_code ec;
#ifdef __linux__
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) {
        return self.string();
    }
#endif
    if (!argv0 || argv0[0] == '\0') {
        return {};
    }
    fs::path path(argv0);
    if (path.is_absolute()) {
        return path.string();
    }
    fs::path absolute = fs::absolute(path, ec);
    return ec ? path.string() : absolute.lexically_normal().string();
}

InitialSurface StartupConfig::initial_surface() const {
    if (force_headless) {
        return InitialSurface::Headless;
    }
    if (force_show) {
        return InitialSurface::Visible;
    }
    if (launched_by_supervisor) {
        return previous_run_unclean ? InitialSurface::Visible : InitialSurface::Headless;
    }
    return InitialSurface::Visible;
}

StartupConfig StartupConfig::capture(int argc, char** argv, const CliArgs& args,
                                     const LivenessMarker& marker) {
    StartupConfig config;
    config.launched_by_supervisor = parse_env_flag(std::getenv(AppConstants::SUPERVISED_ENV));
    config.previous_run_unclean = marker.present();
    if (config.previous_run_unclean) {
        config.marker_written_at = marker.written_at();
    }

    config.executable_path = current_executable_path(argc > 0 ? argv[0] : nullptr);
    for (int i = 1; i < argc; ++i) {
        // One-shot actions and surface overrides are not repeated on relaunch
        if (strcmp(argv[i], "--run-task") == 0 || strcmp(argv[i], "--show") == 0 ||
            strcmp(argv[i], "--headless") == 0) {
            continue;
        }
        config.relaunch_args.emplace_back(argv[i]);
    }

    config.force_headless = args.force_headless;
    config.force_show = args.force_show;
    config.run_task_at_startup = args.run_task;

    spdlog::debug("[Startup] supervised={} previous_run_unclean={} initial={}",
                  config.launched_by_supervisor, config.previous_run_unclean,
                  initial_surface_name(config.initial_surface()));
    return config;
}

} // namespace resolute
