// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "surface_backend_mock.h"

#include <spdlog/spdlog.h>

namespace resolute {

bool SurfaceBackendMock::create() {
    ++create_count;
    if (fail_create_) {
        spdlog::debug("[SurfaceMock] create() failing on request");
        return false;
    }
    exists_ = true;
    visible_ = false;
    return true;
}

void SurfaceBackendMock::show() {
    ++show_count;
    visible_ = exists_;
}

void SurfaceBackendMock::hide() {
    ++hide_count;
    visible_ = false;
}

void SurfaceBackendMock::raise() {
    ++raise_count;
}

void SurfaceBackendMock::destroy() {
    ++destroy_count;
    exists_ = false;
    visible_ = false;
}

void SurfaceBackendMock::set_status(const std::string& text) {
    status_ = text;
}

void SurfaceBackendMock::poll_events(std::vector<SurfaceEvent>& out) {
    while (!pending_.empty()) {
        out.push_back(pending_.front());
        pending_.pop_front();
    }
}

void SurfaceBackendMock::lose_surface() {
    exists_ = false;
    visible_ = false;
    pending_.push_back(SurfaceEvent::SurfaceLost);
}

} // namespace resolute
