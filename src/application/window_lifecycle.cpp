// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "window_lifecycle.h"

#include "app_constants.h"
#include "config.h"
#include "exit_classifier.h"
#include "surface_backend.h"

#include <spdlog/spdlog.h>

namespace resolute {

const char* surface_state_name(SurfaceState state) {
    switch (state) {
    case SurfaceState::Uninitialized:
        return "Uninitialized";
    case SurfaceState::Visible:
        return "Visible";
    case SurfaceState::Hidden:
        return "Hidden";
    case SurfaceState::Headless:
        return "Headless";
    case SurfaceState::Destroyed:
        return "Destroyed";
    }
    return "Invalid";
}

LifecyclePolicy LifecyclePolicy::from_config(const Config& config) {
    LifecyclePolicy policy;
    policy.persistent_background = config.get<bool>("/lifecycle/persistent_background", false);
    policy.close_reshow_delay_ms = static_cast<uint32_t>(config.get_in_range(
        "/lifecycle/close_reshow_delay_ms", AppConstants::Lifecycle::CLOSE_RESHOW_DELAY_MS,
        AppConstants::Lifecycle::MIN_DELAY_MS, AppConstants::Lifecycle::MAX_DELAY_MS));
    policy.recreate_delay_ms = static_cast<uint32_t>(config.get_in_range(
        "/lifecycle/recreate_delay_ms", AppConstants::Lifecycle::RECREATE_DELAY_MS,
        AppConstants::Lifecycle::MIN_DELAY_MS, AppConstants::Lifecycle::MAX_DELAY_MS));
    return policy;
}

bool WindowLifecycle::is_legal_transition(SurfaceState from, SurfaceState to, bool teardown) {
    switch (from) {
    case SurfaceState::Uninitialized:
        return to == SurfaceState::Visible || to == SurfaceState::Headless ||
               (teardown && to == SurfaceState::Destroyed);
    case SurfaceState::Visible:
        return to == SurfaceState::Hidden || to == SurfaceState::Destroyed;
    case SurfaceState::Hidden:
        return to == SurfaceState::Visible || to == SurfaceState::Destroyed;
    case SurfaceState::Headless:
        return to == SurfaceState::Visible || (teardown && to == SurfaceState::Destroyed);
    case SurfaceState::Destroyed:
        return to == SurfaceState::Visible && !teardown;
    }
    return false;
}

WindowLifecycle::WindowLifecycle(SurfaceBackend& backend, MainLoop& loop,
                                 const QuitIntentRecorder& intent, LifecyclePolicy policy)
    : backend_(backend), loop_(loop), intent_(intent), policy_(policy) {}

WindowLifecycle::~WindowLifecycle() {
    cancel_pending();
}

bool WindowLifecycle::transition(SurfaceState to) {
    if (!is_legal_transition(state_, to, teardown_)) {
        spdlog::error("[Lifecycle] Rejected transition {} -> {}", surface_state_name(state_),
                      surface_state_name(to));
        return false;
    }
    spdlog::info("[Lifecycle] {} -> {}", surface_state_name(state_), surface_state_name(to));
    state_ = to;
    return true;
}

void WindowLifecycle::start(InitialSurface initial) {
    if (state_ != SurfaceState::Uninitialized) {
        spdlog::warn("[Lifecycle] start() called twice (state {})", surface_state_name(state_));
        return;
    }

    if (initial == InitialSurface::Headless) {
        transition(SurfaceState::Headless);
        return;
    }

    if (!backend_.create()) {
        spdlog::error("[Lifecycle] Initial surface creation failed, starting headless");
        transition(SurfaceState::Headless);
        schedule_materialize(policy_.recreate_delay_ms, "retry create");
        return;
    }
    backend_.show();
    transition(SurfaceState::Visible);
}

bool WindowLifecycle::veto(const char* gesture) {
    spdlog::info("[Lifecycle] {} vetoed (intent {})", gesture,
                 quit_intent_name(intent_.current()));

    switch (state_) {
    case SurfaceState::Visible:
        backend_.hide();
        transition(SurfaceState::Hidden);
        [[fallthrough]];
    case SurfaceState::Hidden:
        // A re-show already pending keeps its deadline
        if (!policy_.persistent_background && !has_pending_timer()) {
            schedule_materialize(policy_.close_reshow_delay_ms, "re-show after veto");
        }
        break;
    default:
        // Headless stays headless; Destroyed keeps its re-creation timer
        break;
    }
    return false;
}

bool WindowLifecycle::on_close_requested() {
    if (teardown_) {
        return true;
    }
    if (intent_.is_user_requested()) {
        spdlog::debug("[Lifecycle] Close allowed: exit was requested");
        return true;
    }
    return veto("Close");
}

bool WindowLifecycle::on_quit_requested() {
    if (teardown_) {
        return true;
    }
    if (intent_.is_user_requested()) {
        spdlog::debug("[Lifecycle] Quit allowed: exit was requested");
        return true;
    }
    return veto("Quit");
}

void WindowLifecycle::on_surface_lost() {
    if (state_ == SurfaceState::Destroyed) {
        return;
    }
    if (state_ != SurfaceState::Visible && state_ != SurfaceState::Hidden) {
        spdlog::debug("[Lifecycle] Surface lost in state {}, ignoring", surface_state_name(state_));
        return;
    }

    spdlog::warn("[Lifecycle] Surface lost");
    // Release whatever the backend still holds before re-creating
    backend_.destroy();
    transition(SurfaceState::Destroyed);

    if (teardown_) {
        return;
    }
    schedule_materialize(policy_.recreate_delay_ms, "re-create after loss");
}

void WindowLifecycle::request_show() {
    if (teardown_) {
        spdlog::debug("[Lifecycle] Show ignored during teardown");
        return;
    }

    switch (state_) {
    case SurfaceState::Visible:
        backend_.raise();
        break;
    case SurfaceState::Hidden:
    case SurfaceState::Headless:
    case SurfaceState::Destroyed:
        materialize();
        break;
    case SurfaceState::Uninitialized:
        spdlog::warn("[Lifecycle] Show requested before start()");
        break;
    }
}

void WindowLifecycle::begin_teardown() {
    if (teardown_) {
        return;
    }
    teardown_ = true;
    cancel_pending();

    if (backend_.exists()) {
        backend_.destroy();
    }
    if (state_ != SurfaceState::Destroyed) {
        transition(SurfaceState::Destroyed);
    }
    spdlog::info("[Lifecycle] Teardown complete");
}

bool WindowLifecycle::materialize() {
    cancel_pending();

    if (!backend_.exists() && !backend_.create()) {
        spdlog::error("[Lifecycle] Surface creation failed, retrying in {} ms",
                      policy_.recreate_delay_ms);
        schedule_materialize(policy_.recreate_delay_ms, "retry create");
        return false;
    }
    backend_.show();
    return transition(SurfaceState::Visible);
}

void WindowLifecycle::schedule_materialize(uint32_t delay_ms, const char* reason) {
    // At most one pending timer; a newer request replaces it
    cancel_pending();
    spdlog::debug("[Lifecycle] Scheduling {} in {} ms", reason, delay_ms);
    pending_timer_ = loop_.schedule(delay_ms, [this]() {
        pending_timer_ = MainLoop::INVALID_TIMER;
        if (teardown_ || state_ == SurfaceState::Visible) {
            return;
        }
        materialize();
    });
}

void WindowLifecycle::cancel_pending() {
    if (pending_timer_ != MainLoop::INVALID_TIMER) {
        loop_.cancel(pending_timer_);
        pending_timer_ = MainLoop::INVALID_TIMER;
    }
}

} // namespace resolute
