// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#ifdef RESOLUTE_DISPLAY_SDL

#include "surface_backend.h"

#include <SDL.h>

namespace resolute {

/**
 * @brief SDL2 desktop window
 *
 * The window is created hidden and only shown on request. Closing it only
 * produces an event; SDL never quits on its own because the last-window
 * hint is off and SDL's signal handlers are disabled (the controller owns
 * SIGINT/SIGTERM).
 */
class SurfaceBackendSDL : public SurfaceBackend {
  public:
    SurfaceBackendSDL(int width, int height);
    ~SurfaceBackendSDL() override;

    bool create() override;
    void show() override;
    void hide() override;
    void raise() override;
    void destroy() override;
    bool exists() const override {
        return window_ != nullptr;
    }
    void set_status(const std::string& text) override;
    void poll_events(std::vector<SurfaceEvent>& out) override;
    const char* name() const override {
        return "sdl";
    }

  private:
    bool init_video();
    void paint();
    void update_title();

    int width_;
    int height_;
    bool video_initialized_ = false;
    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    std::string status_;
};

} // namespace resolute

#endif // RESOLUTE_DISPLAY_SDL
