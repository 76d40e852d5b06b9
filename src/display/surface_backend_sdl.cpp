// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifdef RESOLUTE_DISPLAY_SDL

#include "surface_backend_sdl.h"

#include <spdlog/spdlog.h>

namespace resolute {

namespace {

// Dark theme background
constexpr Uint8 BG_R = 0x12;
constexpr Uint8 BG_G = 0x12;
constexpr Uint8 BG_B = 0x12;

constexpr const char* WINDOW_TITLE = "Resolute";

} // namespace

SurfaceBackendSDL::SurfaceBackendSDL(int width, int height) : width_(width), height_(height) {}

SurfaceBackendSDL::~SurfaceBackendSDL() {
    destroy();
    if (video_initialized_) {
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
        video_initialized_ = false;
    }
}

bool SurfaceBackendSDL::init_video() {
    if (video_initialized_) {
        return true;
    }

    // Must be set before SDL_Init: SIGINT/SIGTERM belong to the controller
    SDL_SetHint(SDL_HINT_NO_SIGNAL_HANDLERS, "1");
    // Closing the only window must not turn into SDL_QUIT
    SDL_SetHint("SDL_QUIT_ON_LAST_WINDOW_CLOSE", "0");

    if (SDL_InitSubSystem(SDL_INIT_VIDEO) < 0) {
        spdlog::error("[SurfaceSDL] SDL_InitSubSystem(VIDEO) failed: {}", SDL_GetError());
        return false;
    }
    video_initialized_ = true;
    return true;
}

bool SurfaceBackendSDL::create() {
    if (window_) {
        return true;
    }
    if (!init_video()) {
        return false;
    }

    window_ = SDL_CreateWindow(WINDOW_TITLE, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                               width_, height_, SDL_WINDOW_HIDDEN | SDL_WINDOW_RESIZABLE);
    if (!window_) {
        spdlog::error("[SurfaceSDL] SDL_CreateWindow failed: {}", SDL_GetError());
        return false;
    }

    renderer_ = SDL_CreateRenderer(window_, -1, 0);
    if (!renderer_) {
        spdlog::warn("[SurfaceSDL] Accelerated renderer unavailable ({}), using software",
                     SDL_GetError());
        renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_SOFTWARE);
    }
    if (!renderer_) {
        spdlog::error("[SurfaceSDL] SDL_CreateRenderer failed: {}", SDL_GetError());
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        return false;
    }

    update_title();
    spdlog::info("[SurfaceSDL] Window created ({}x{})", width_, height_);
    return true;
}

void SurfaceBackendSDL::show() {
    if (!window_) {
        return;
    }
    SDL_ShowWindow(window_);
    SDL_RaiseWindow(window_);
    paint();
}

void SurfaceBackendSDL::hide() {
    if (window_) {
        SDL_HideWindow(window_);
    }
}

void SurfaceBackendSDL::raise() {
    if (!window_) {
        return;
    }
    SDL_RestoreWindow(window_);
    SDL_RaiseWindow(window_);
}

void SurfaceBackendSDL::destroy() {
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        spdlog::debug("[SurfaceSDL] Window destroyed");
    }
}

void SurfaceBackendSDL::set_status(const std::string& text) {
    status_ = text;
    update_title();
}

void SurfaceBackendSDL::update_title() {
    if (!window_) {
        return;
    }
    std::string title = WINDOW_TITLE;
    if (!status_.empty()) {
        title += " - " + status_;
    }
    SDL_SetWindowTitle(window_, title.c_str());
}

void SurfaceBackendSDL::paint() {
    if (!renderer_) {
        return;
    }
    SDL_SetRenderDrawColor(renderer_, BG_R, BG_G, BG_B, 0xFF);
    SDL_RenderClear(renderer_);
    SDL_RenderPresent(renderer_);
}

void SurfaceBackendSDL::poll_events(std::vector<SurfaceEvent>& out) {
    if (!video_initialized_) {
        return;
    }

    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
        case SDL_QUIT:
            out.push_back(SurfaceEvent::QuitRequested);
            break;
        case SDL_WINDOWEVENT:
            if (event.window.event == SDL_WINDOWEVENT_CLOSE) {
                out.push_back(SurfaceEvent::CloseRequested);
            } else if (event.window.event == SDL_WINDOWEVENT_EXPOSED) {
                paint();
            }
            break;
        case SDL_KEYDOWN:
            if ((event.key.keysym.mod & KMOD_CTRL) == 0 || event.key.repeat) {
                break;
            }
            switch (event.key.keysym.sym) {
            case SDLK_q:
                out.push_back(SurfaceEvent::ExitShortcut);
                break;
            case SDLK_t:
                out.push_back(SurfaceEvent::RunTaskShortcut);
                break;
            case SDLK_s:
                out.push_back(SurfaceEvent::ShowShortcut);
                break;
            default:
                break;
            }
            break;
        case SDL_RENDER_DEVICE_RESET:
            // Renderer and its textures are gone; treat the surface as lost
            spdlog::warn("[SurfaceSDL] Render device reset");
            out.push_back(SurfaceEvent::SurfaceLost);
            break;
        case SDL_RENDER_TARGETS_RESET:
            paint();
            break;
        default:
            break;
        }
    }
}

} // namespace resolute

#endif // RESOLUTE_DISPLAY_SDL
