// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_constants.h"
#include "cli_args.h"
#include "config.h"
#include "instance_arbiter.h"
#include "logging_init.h"
#include "resilience_controller.h"
#include "restart_store.h"
#include "runtime_paths.h"
#include "startup_config.h"
#include "supervisor_installer.h"
#include "surface_backend.h"

#include <spdlog/spdlog.h>

#include <cstdio>

using namespace resolute;

namespace {

void init_logging(const CliArgs& args, const Config& config, const RuntimePaths& paths) {
    logging::LogConfig log_config;
    log_config.level = logging::resolve_log_level(args.verbosity,
                                                  config.get<std::string>("/log_level", "warn"));
    log_config.target = logging::parse_log_target(
        args.log_dest.empty() ? config.get<std::string>("/log_dest", "auto") : args.log_dest);
    log_config.file_path = args.log_file.empty() ? paths.log_file() : args.log_file;
    logging::init(log_config);
}

/// Console-only logging until the config has been read
void init_early_logging(const CliArgs& args) {
    logging::LogConfig log_config;
    log_config.level = logging::resolve_log_level(args.verbosity, "");
    log_config.target = logging::LogTarget::Console;
    logging::init(log_config);
}

int uninstall_supervisor(const Config& config, const RuntimePaths& paths, const char* argv0) {
    auto installer =
        SupervisorInstaller::create(config, paths, false, current_executable_path(argv0));
    bool ok = installer->uninstall();
    printf("Supervisor '%s' %s\n", installer->name(), ok ? "uninstalled" : "not uninstalled");
    return ok ? AppConstants::ExitCode::CLEAN : AppConstants::ExitCode::ABNORMAL;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.exit_code;
    }

    init_early_logging(args);
    RuntimePaths paths = RuntimePaths::resolve();

    // A second launch (or --quit) only signals the primary: no config, marker or directories
    if (!args.uninstall_supervisor) {
        ActivationIntent intent =
            args.forward_quit ? ActivationIntent::Quit : ActivationIntent::Show;
        if (forward_to_running_instance(paths.instance_lock_file(), intent)) {
            return AppConstants::ExitCode::CLEAN;
        }
        if (args.forward_quit) {
            printf("resolute is not running\n");
            return AppConstants::ExitCode::CLEAN;
        }
    }

    if (!paths.ensure_directories()) {
        fprintf(stderr, "Warning: could not create resolute directories\n");
    }

    Config config;
    config.init(args.config_path.empty() ? paths.config_file() : args.config_path);

    init_logging(args, config, paths);

    if (args.uninstall_supervisor) {
        return uninstall_supervisor(config, paths, argv[0]);
    }

    RestartStore store(paths.state_dir);
    LivenessMarker marker(store);
    StartupConfig startup = StartupConfig::capture(argc, argv, args, marker);

    std::string backend_type =
        args.backend.empty() ? config.get<std::string>("/display/backend", "auto") : args.backend;
    auto backend = SurfaceBackend::create(
        backend_type, config.get<int>("/display/width", AppConstants::Display::DEFAULT_WIDTH),
        config.get<int>("/display/height", AppConstants::Display::DEFAULT_HEIGHT));

    auto installer = SupervisorInstaller::create(config, paths, args.no_supervisor,
                                                 startup.executable_path);

    ResilienceController controller(std::move(startup), config, paths, std::move(backend),
                                    std::move(installer));
    return controller.run();
}
