// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "surface_backend.h"

#include <deque>

namespace resolute {

/**
 * @brief Window-less surface backend
 *
 * Used by the test suite and by `--backend mock` on machines without a
 * display. Counts every call and replays events queued with inject().
 */
class SurfaceBackendMock : public SurfaceBackend {
  public:
    bool create() override;
    void show() override;
    void hide() override;
    void raise() override;
    void destroy() override;
    bool exists() const override {
        return exists_;
    }
    void set_status(const std::string& text) override;
    void poll_events(std::vector<SurfaceEvent>& out) override;
    const char* name() const override {
        return "mock";
    }

    // ========================================================================
    // Test controls
    // ========================================================================

    void inject(SurfaceEvent event) {
        pending_.push_back(event);
    }

    /// Make the next create() calls fail
    void set_fail_create(bool fail) {
        fail_create_ = fail;
    }

    /// Simulate the surface vanishing (backend side) and report SurfaceLost
    void lose_surface();

    bool visible() const {
        return visible_;
    }
    const std::string& status() const {
        return status_;
    }

    int create_count = 0;
    int show_count = 0;
    int hide_count = 0;
    int raise_count = 0;
    int destroy_count = 0;

  private:
    bool exists_ = false;
    bool visible_ = false;
    bool fail_create_ = false;
    std::string status_;
    std::deque<SurfaceEvent> pending_;
};

} // namespace resolute
