// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file window_lifecycle.h
 * @brief Window surface state machine with quit veto and re-show/re-creation
 *
 * States and the only legal edges:
 *
 *   Uninitialized -> Visible | Headless
 *   Visible  <-> Hidden
 *   Headless  -> Visible
 *   Visible | Hidden -> Destroyed      (surface lost, or final teardown)
 *   Destroyed -> Visible               (re-creation)
 *
 * Final teardown may also end a Headless or never-started surface in
 * Destroyed. Teardown only begins after the sanctioned exit control, so
 * close/quit gestures alone always leave the surface Visible or Hidden.
 */

#pragma once

#include "main_loop.h"
#include "startup_config.h"

#include <cstdint>

namespace resolute {

class Config;
class QuitIntentRecorder;
class SurfaceBackend;

enum class SurfaceState { Uninitialized, Visible, Hidden, Headless, Destroyed };

const char* surface_state_name(SurfaceState state);

/**
 * @brief Platform policy knobs (config /lifecycle/...)
 */
struct LifecyclePolicy {
    /// Platform keeps a background presence (tray/dock): a hidden surface stays hidden
    bool persistent_background = false;
    uint32_t close_reshow_delay_ms = 2000;
    uint32_t recreate_delay_ms = 1000;

    static LifecyclePolicy from_config(const Config& config);
};

class WindowLifecycle {
  public:
    WindowLifecycle(SurfaceBackend& backend, MainLoop& loop, const QuitIntentRecorder& intent,
                    LifecyclePolicy policy = {});
    ~WindowLifecycle();

    WindowLifecycle(const WindowLifecycle&) = delete;
    WindowLifecycle& operator=(const WindowLifecycle&) = delete;

    /**
     * @brief Bring up the initial surface
     *
     * If the window cannot be created the surface starts Headless and a
     * re-creation is scheduled.
     */
    void start(InitialSurface initial);

    /**
     * @brief Window close gesture
     * @return true if the close may proceed (intent is UserRequested)
     */
    bool on_close_requested();

    /**
     * @brief Quit-all gesture or process quit signal (SIGTERM, SIGINT, SIGHUP)
     * @return true if the quit may proceed (intent is UserRequested)
     */
    bool on_quit_requested();

    /// The rendering surface went away underneath us
    void on_surface_lost();

    /// Show or raise (SIGUSR1, second-instance activation, Ctrl+S)
    void request_show();

    /**
     * @brief Final teardown: cancel timers, destroy the surface
     *
     * Terminal; every later request is ignored.
     */
    void begin_teardown();

    SurfaceState state() const {
        return state_;
    }
    bool in_teardown() const {
        return teardown_;
    }
    bool has_pending_timer() const {
        return pending_timer_ != MainLoop::INVALID_TIMER && loop_.is_pending(pending_timer_);
    }
    const LifecyclePolicy& policy() const {
        return policy_;
    }

    static bool is_legal_transition(SurfaceState from, SurfaceState to, bool teardown);

  private:
    bool transition(SurfaceState to);
    bool veto(const char* gesture);
    bool materialize();
    void schedule_materialize(uint32_t delay_ms, const char* reason);
    void cancel_pending();

    SurfaceBackend& backend_;
    MainLoop& loop_;
    const QuitIntentRecorder& intent_;
    LifecyclePolicy policy_;

    SurfaceState state_ = SurfaceState::Uninitialized;
    bool teardown_ = false;
    MainLoop::TimerId pending_timer_ = MainLoop::INVALID_TIMER;
};

} // namespace resolute
