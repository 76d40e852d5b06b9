// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "test_fixtures.h"

#include "app_constants.h"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace resolute {
namespace test {

TempDirFixture::TempDirFixture() {
    std::string templ = (fs::temp_directory_path() / "resolute_test_XXXXXX").string();
    if (mkdtemp(templ.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed");
    }
    root = templ;

    if (const char* prev = getenv(AppConstants::HOME_OVERRIDE_ENV)) {
        previous_home_ = prev;
        had_previous_home_ = true;
    }
    setenv(AppConstants::HOME_OVERRIDE_ENV, root.c_str(), 1);

    paths = RuntimePaths::under(root);
    paths.ensure_directories();
}

TempDirFixture::~TempDirFixture() {
    if (had_previous_home_) {
        setenv(AppConstants::HOME_OVERRIDE_ENV, previous_home_.c_str(), 1);
    } else {
        unsetenv(AppConstants::HOME_OVERRIDE_ENV);
    }
    std::error_code ec;
    fs::remove_all(root, ec);
}

std::string TempDirFixture::path(const std::string& relative) const {
    return root + "/" + relative;
}

void TempDirFixture::write_file(const std::string& relative, const std::string& content) const {
    fs::path p = path(relative);
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::trunc);
    out << content;
}

std::string TempDirFixture::read_file(const std::string& relative) const {
    std::ifstream in(path(relative));
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool TempDirFixture::file_exists(const std::string& relative) const {
    return fs::exists(path(relative));
}

std::string TempDirFixture::write_script(const std::string& relative,
                                         const std::string& body) const {
    write_file(relative, "#!/bin/sh\n" + body + "\n");
    fs::permissions(path(relative), fs::perms::owner_all, fs::perm_options::replace);
    return path(relative);
}

bool wait_until(const std::function<bool()>& condition, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

pid_t fork_child(const std::function<int()>& body) {
    pid_t pid = fork();
    if (pid == 0) {
        int code = 127;
        try {
            code = body();
        } catch (...) {
            code = 126;
        }
        _exit(code);
    }
    return pid;
}

int wait_child(pid_t pid, int timeout_ms) {
    int status = 0;
    bool done = wait_until(
        [&]() {
            pid_t r = waitpid(pid, &status, WNOHANG);
            return r == pid;
        },
        timeout_ms);
    if (!done) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        return -1;
    }
    return status;
}

} // namespace test
} // namespace resolute
