// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace resolute {

/**
 * @brief Things the window system tells the controller
 */
enum class SurfaceEvent {
    CloseRequested,  ///< Window close button
    QuitRequested,   ///< Application-wide quit (SDL_QUIT, session end)
    ExitShortcut,    ///< Ctrl+Q: the sanctioned exit control
    RunTaskShortcut, ///< Ctrl+T: start the background task
    ShowShortcut,    ///< Ctrl+S: show/raise
    SurfaceLost,     ///< Rendering surface destroyed underneath us
};

const char* surface_event_name(SurfaceEvent event);

/**
 * @brief Abstract window surface
 *
 * Provides a small platform-agnostic API so the lifecycle state machine
 * never talks to the window system directly. Concrete implementations:
 * - SurfaceBackendSDL: SDL2 desktop window
 * - SurfaceBackendMock: records calls, lets tests inject events
 *
 * All methods are called from the main loop thread.
 */
class SurfaceBackend {
  public:
    virtual ~SurfaceBackend() = default;

    /**
     * @brief Create the surface, initially hidden
     * @return false if the window system refused
     */
    virtual bool create() = 0;

    virtual void show() = 0;
    virtual void hide() = 0;

    /// Bring a visible surface to the front
    virtual void raise() = 0;

    virtual void destroy() = 0;
    virtual bool exists() const = 0;

    /// Latest status line (the worker's progress)
    virtual void set_status(const std::string& text) = 0;

    /**
     * @brief Append pending events to out
     */
    virtual void poll_events(std::vector<SurfaceEvent>& out) = 0;

    virtual const char* name() const = 0;

    // ========================================================================
    // Factory
    // ========================================================================

    /**
     * @brief Create a backend by name
     *
     * - "sdl": SDL2 window (only when built with RESOLUTE_DISPLAY_SDL)
     * - "mock": no window
     * - "auto": SDL when compiled in, mock otherwise
     *
     * Unknown names and an unavailable SDL fall back to mock with a warning.
     */
    static std::unique_ptr<SurfaceBackend> create(const std::string& type, int width, int height);
};

} // namespace resolute
