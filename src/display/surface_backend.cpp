// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "surface_backend.h"

#include "surface_backend_mock.h"

#include <spdlog/spdlog.h>

#ifdef RESOLUTE_DISPLAY_SDL
#include "surface_backend_sdl.h"
#endif

namespace resolute {

const char* surface_event_name(SurfaceEvent event) {
    switch (event) {
    case SurfaceEvent::CloseRequested:
        return "CloseRequested";
    case SurfaceEvent::QuitRequested:
        return "QuitRequested";
    case SurfaceEvent::ExitShortcut:
        return "ExitShortcut";
    case SurfaceEvent::RunTaskShortcut:
        return "RunTaskShortcut";
    case SurfaceEvent::ShowShortcut:
        return "ShowShortcut";
    case SurfaceEvent::SurfaceLost:
        return "SurfaceLost";
    }
    return "Unknown";
}

std::unique_ptr<SurfaceBackend> SurfaceBackend::create(const std::string& type, int width,
                                                       int height) {
    if (type == "mock") {
        spdlog::debug("[SurfaceBackend] Creating mock backend");
        return std::make_unique<SurfaceBackendMock>();
    }

    if (type != "sdl" && type != "auto") {
        spdlog::warn("[SurfaceBackend] Unknown backend '{}' - using mock backend", type);
        return std::make_unique<SurfaceBackendMock>();
    }

#ifdef RESOLUTE_DISPLAY_SDL
    spdlog::debug("[SurfaceBackend] Creating SDL backend ({}x{})", width, height);
    return std::make_unique<SurfaceBackendSDL>(width, height);
#else
    (void)width;
    (void)height;
    spdlog::warn("[SurfaceBackend] Built without SDL - using mock backend");
    return std::make_unique<SurfaceBackendMock>();
#endif
}

} // namespace resolute
