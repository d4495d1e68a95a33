#pragma once

#include <algorithm>
#include <vector>
#include <SDL.h>
#include "utils/blocker.hpp"
#include "utils/light_source.hpp"

// World to viewport mapping: screen = world * scale + offset.
struct ViewTransform {
    float scale = 1.0f;
    float offset_x = 0.0f;
    float offset_y = 0.0f;

    SDL_FPoint world_to_screen(float x, float y) const {
        return SDL_FPoint{ x * scale + offset_x, y * scale + offset_y };
    }

    // Largest uniform scale that shows the whole world, centered on screen.
    static ViewTransform fit(float world_w, float world_h, int screen_w, int screen_h) {
        ViewTransform v;
        if (world_w <= 0.0f || world_h <= 0.0f || screen_w <= 0 || screen_h <= 0) return v;
        v.scale = std::min(screen_w / world_w, screen_h / world_h);
        v.offset_x = (screen_w - world_w * v.scale) * 0.5f;
        v.offset_y = (screen_h - world_h * v.scale) * 0.5f;
        return v;
    }
};

// Everything one frame reads. Shared as shared_ptr<const LightingSnapshot>.
struct LightingSnapshot {
    std::vector<LightSource> lights;
    std::vector<Blocker> blockers;
    std::vector<Blocker> discovery_blockers;
    std::vector<GlowPoint> glows;
    float ambient_darkness = 0.72f;
    Flicker global_flicker{true, 0.5f, 0.08f};
    float elapsed = 0.0f;
    float tile_size = 100.0f;
    ViewTransform view;
};
