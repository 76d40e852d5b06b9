// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "resolute_version.h"

#include <cstdio>
#include <cstring>

namespace resolute {

void print_usage(const char* program) {
    printf("Usage: %s [options]\n\n", program);
    printf("Options:\n");
    printf("  -c, --config <path>      Config file (default: $XDG_CONFIG_HOME/resolute/resolute.json)\n");
    printf("      --headless           Start without a visible window\n");
    printf("      --show               Start visible, or show the running instance\n");
    printf("      --quit               Ask the running instance to exit cleanly\n");
    printf("      --run-task           Start the background task at startup\n");
    printf("      --no-supervisor      Do not register the watchdog supervisor\n");
    printf("      --uninstall-supervisor  Stop the registered watchdog and exit\n");
    printf("      --backend <type>     Window backend: sdl, mock, auto\n");
    printf("  -v, --verbose            Increase log verbosity (-v info, -vv debug, -vvv trace)\n");
    printf("      --log-dest <dest>    Log target: auto, journal, syslog, file, console\n");
    printf("      --log-file <path>    Log file path (with --log-dest file)\n");
    printf("  -h, --help               Show this help\n");
    printf("  -V, --version            Show version\n");
    printf("\nSignals:\n");
    printf("  SIGUSR1  show the window\n");
    printf("  SIGUSR2  exit cleanly (same as --quit)\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                printf("Error: %s requires a path\n", argv[i]);
                args.exit_code = 1;
                return false;
            }
            args.config_path = argv[++i];
        } else if (strcmp(argv[i], "--headless") == 0) {
            args.force_headless = true;
        } else if (strcmp(argv[i], "--show") == 0) {
            args.force_show = true;
        } else if (strcmp(argv[i], "--quit") == 0) {
            args.forward_quit = true;
        } else if (strcmp(argv[i], "--run-task") == 0) {
            args.run_task = true;
        } else if (strcmp(argv[i], "--no-supervisor") == 0) {
            args.no_supervisor = true;
        } else if (strcmp(argv[i], "--uninstall-supervisor") == 0) {
            args.uninstall_supervisor = true;
        } else if (strcmp(argv[i], "--backend") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --backend requires an argument\n");
                args.exit_code = 1;
                return false;
            }
            const char* backend = argv[++i];
            if (strcmp(backend, "sdl") != 0 && strcmp(backend, "mock") != 0 &&
                strcmp(backend, "auto") != 0) {
                printf("Unknown backend: %s\n", backend);
                printf("Available backends: sdl, mock, auto\n");
                args.exit_code = 1;
                return false;
            }
            args.backend = backend;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        } else if (strncmp(argv[i], "-vv", 3) == 0 && strspn(argv[i] + 1, "v") == strlen(argv[i] + 1)) {
            // -vv, -vvv: one level per 'v'
            args.verbosity += static_cast<int>(strlen(argv[i] + 1));
        } else if (strcmp(argv[i], "--log-dest") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --log-dest requires an argument\n");
                args.exit_code = 1;
                return false;
            }
            args.log_dest = argv[++i];
        } else if (strcmp(argv[i], "--log-file") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --log-file requires a path\n");
                args.exit_code = 1;
                return false;
            }
            args.log_file = argv[++i];
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            args.exit_code = 0;
            return false;
        } else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            printf("resolute %s\n", RESOLUTE_VERSION);
            args.exit_code = 0;
            return false;
        } else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            args.exit_code = 1;
            return false;
        }
    }

    if (args.force_headless && args.force_show) {
        printf("Error: --headless and --show are mutually exclusive\n");
        args.exit_code = 1;
        return false;
    }

    return true;
}

} // namespace resolute
