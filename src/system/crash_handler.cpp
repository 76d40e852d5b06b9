// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "system/crash_handler.h"

#include "process_utils.h"
#include "resolute_version.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <signal.h>
#include <string>
#include <unistd.h>

// backtrace() is available on glibc (Linux) and macOS
#if defined(__GLIBC__) || defined(__APPLE__)
#include <execinfo.h>
#define HAVE_BACKTRACE 1
#endif

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace resolute {

// =============================================================================
// Static state for the async-signal-safe handler
// Everything is prepared at install time -- NO heap in the signal handler.
// =============================================================================

namespace {

constexpr size_t MAX_PATH_LEN = 512;

char s_crash_path[MAX_PATH_LEN] = {};
volatile sig_atomic_t s_installed = 0;
time_t s_start_time = 0;

const ExecImage* s_relaunch = nullptr;
unsigned s_relaunch_delay_ms = 1000;

constexpr int FATAL_SIGNALS[] = {SIGSEGV, SIGABRT, SIGBUS, SIGFPE};
struct sigaction s_old_actions[4] = {};

// =============================================================================
// Async-signal-safe helpers
// =============================================================================

void safe_write(int fd, const char* str) {
    if (!str)
        return;
    size_t len = 0;
    while (str[len] != '\0')
        ++len;
    // Best effort inside a signal handler
    ssize_t ignored = write(fd, str, len);
    (void)ignored;
}

/// Decimal conversion into the tail of buf; returns the start of the digits
char* int_to_str(char* buf, size_t buf_size, long value) {
    if (buf_size == 0)
        return buf;

    bool negative = (value < 0);
    unsigned long uval =
        negative ? static_cast<unsigned long>(-value) : static_cast<unsigned long>(value);

    char* p = buf + buf_size - 1;
    *p = '\0';
    if (uval == 0) {
        *--p = '0';
    }
    while (uval > 0 && p > buf) {
        *--p = static_cast<char>('0' + uval % 10);
        uval /= 10;
    }
    if (negative && p > buf) {
        *--p = '-';
    }
    return p;
}

/// "0x..." conversion into the tail of buf
char* ptr_to_hex(char* buf, size_t buf_size, uintptr_t value) {
    if (buf_size < 4)
        return buf;

    static const char hex_chars[] = "0123456789abcdef";
    char* p = buf + buf_size - 1;
    *p = '\0';
    if (value == 0) {
        *--p = '0';
    }
    while (value > 0 && p > buf + 2) {
        *--p = hex_chars[value & 0xF];
        value >>= 4;
    }
    *--p = 'x';
    *--p = '0';
    return p;
}

const char* signal_name(int sig) {
    switch (sig) {
    case SIGSEGV:
        return "SIGSEGV";
    case SIGABRT:
        return "SIGABRT";
    case SIGBUS:
        return "SIGBUS";
    case SIGFPE:
        return "SIGFPE";
    default:
        return "UNKNOWN";
    }
}

void write_field(int fd, const char* key, const char* value) {
    safe_write(fd, key);
    safe_write(fd, ":");
    safe_write(fd, value);
    safe_write(fd, "\n");
}

void write_crash_report(int sig, siginfo_t* info) {
    int fd = open(s_crash_path, O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return;
    }

    char num_buf[32];
    char hex_buf[32];

    write_field(fd, "signal", int_to_str(num_buf, sizeof(num_buf), sig));
    write_field(fd, "name", signal_name(sig));
    write_field(fd, "version", RESOLUTE_VERSION);

    // time() is async-signal-safe per POSIX
    time_t now = time(nullptr);
    write_field(fd, "timestamp", int_to_str(num_buf, sizeof(num_buf), static_cast<long>(now)));

    long uptime = 0;
    if (s_start_time > 0 && now >= s_start_time) {
        uptime = static_cast<long>(now - s_start_time);
    }
    write_field(fd, "uptime", int_to_str(num_buf, sizeof(num_buf), uptime));

    if (info) {
        write_field(fd, "fault_addr",
                    ptr_to_hex(hex_buf, sizeof(hex_buf),
                               reinterpret_cast<uintptr_t>(info->si_addr)));
    }

    // backtrace() is not formally async-signal-safe but is widely used in
    // crash handlers on glibc and macOS
#ifdef HAVE_BACKTRACE
    void* frames[64];
    int frame_count = backtrace(frames, 64);
    for (int i = 0; i < frame_count; ++i) {
        write_field(fd, "bt",
                    ptr_to_hex(hex_buf, sizeof(hex_buf), reinterpret_cast<uintptr_t>(frames[i])));
    }
#endif

    close(fd);
}

void crash_signal_handler(int sig, siginfo_t* info, void* /*ucontext*/) {
    write_crash_report(sig, info);

    if (s_relaunch) {
        spawn_delayed_relaunch(*s_relaunch, s_relaunch_delay_ms);
    }

    // Re-raise with the default action so the exit status shows the signal
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_DFL;
    sigaction(sig, &sa, nullptr);
    raise(sig);

    // Fallback if raise() somehow returns
    _exit(128 + sig);
}

} // namespace

// =============================================================================
// Public API
// =============================================================================

namespace crash_handler {

void install(const std::string& crash_file_path, const ExecImage* relaunch,
             unsigned relaunch_delay_ms) {
    if (s_installed) {
        spdlog::debug("[CrashHandler] Already installed, skipping");
        return;
    }

    if (crash_file_path.size() >= MAX_PATH_LEN) {
        spdlog::error("[CrashHandler] Path too long ({} >= {}), truncating",
                      crash_file_path.size(), MAX_PATH_LEN);
    }
    size_t copy_len = std::min(crash_file_path.size(), MAX_PATH_LEN - 1);
    std::memcpy(s_crash_path, crash_file_path.c_str(), copy_len);
    s_crash_path[copy_len] = '\0';

    s_start_time = time(nullptr);
    s_relaunch = relaunch;
    s_relaunch_delay_ms = relaunch_delay_ms;

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_sigaction = crash_signal_handler;
    sigemptyset(&sa.sa_mask);
    // SA_RESETHAND: a fault inside the handler takes the default action
    sa.sa_flags = SA_RESETHAND | SA_SIGINFO;

    for (size_t i = 0; i < std::size(FATAL_SIGNALS); ++i) {
        sigaction(FATAL_SIGNALS[i], &sa, &s_old_actions[i]);
    }

    s_installed = 1;
    spdlog::info("[CrashHandler] Installed signal handlers (crash file: {}, relaunch: {})",
                 s_crash_path, relaunch ? "yes" : "no");
}

void uninstall() {
    if (!s_installed) {
        return;
    }

    for (size_t i = 0; i < std::size(FATAL_SIGNALS); ++i) {
        sigaction(FATAL_SIGNALS[i], &s_old_actions[i], nullptr);
    }

    s_installed = 0;
    s_relaunch = nullptr;
    s_crash_path[0] = '\0';
    spdlog::debug("[CrashHandler] Uninstalled signal handlers");
}

bool is_installed() {
    return s_installed != 0;
}

bool has_crash_file(const std::string& crash_file_path) {
    std::error_code ec;
    return fs::exists(crash_file_path, ec) && fs::file_size(crash_file_path, ec) > 0;
}

json read_crash_file(const std::string& crash_file_path) {
    std::ifstream file(crash_file_path);
    if (!file.good()) {
        spdlog::warn("[CrashHandler] Cannot open crash file: {}", crash_file_path);
        return nullptr;
    }

    json result;
    json backtrace_arr = json::array();

    std::string line;
    while (std::getline(file, line)) {
        auto colon_pos = line.find(':');
        if (colon_pos == std::string::npos || colon_pos == 0) {
            continue;
        }

        std::string key = line.substr(0, colon_pos);
        std::string value = line.substr(colon_pos + 1);

        if (key == "bt") {
            backtrace_arr.push_back(value);
            continue;
        }

        if (key == "signal" || key == "timestamp" || key == "uptime") {
            try {
                result[key == "uptime" ? "uptime_sec" : key] = std::stol(value);
            } catch (const std::exception&) {
                result[key == "uptime" ? "uptime_sec" : key] = 0;
            }
        } else if (key == "name") {
            result["signal_name"] = value;
        } else if (key == "version") {
            result["app_version"] = value;
        } else if (key == "fault_addr") {
            result["fault_addr"] = value;
        }
    }

    if (!backtrace_arr.empty()) {
        result["backtrace"] = backtrace_arr;
    }

    if (!result.contains("signal") || !result.contains("signal_name")) {
        spdlog::warn("[CrashHandler] Crash file missing required fields");
        return nullptr;
    }

    spdlog::info("[CrashHandler] Read crash file: signal={} ({})", result.value("signal", 0),
                 result.value("signal_name", "unknown"));
    return result;
}

void remove_crash_file(const std::string& crash_file_path) {
    std::error_code ec;
    if (fs::remove(crash_file_path, ec)) {
        spdlog::debug("[CrashHandler] Removed crash file: {}", crash_file_path);
    } else if (ec) {
        spdlog::warn("[CrashHandler] Failed to remove crash file: {}", ec.message());
    }
}

} // namespace crash_handler
} // namespace resolute
