// === File: light_source.hpp ===

#pragma once

#include <SDL.h>
#include <string>
#include <vector>

struct Flicker {
    bool  enabled = false;
    float speed   = 0.5f;
    float amount  = 0.1f;
};

struct LightSource {
    std::string id;
    float x = 0.0f;
    float y = 0.0f;
    float radius = 64.0f;
    float intensity = 1.0f;
    SDL_Color color = {255, 255, 255, 255};
    bool has_flicker = false;
    Flicker flicker;
};

struct GlowPoint {
    float x = 0.0f;
    float y = 0.0f;
};

// Clamps radius to >= 0 and intensity to [0,1]. Non-finite values become 0.
LightSource sanitize_light(const LightSource& light);

std::vector<LightSource> sanitize_lights(const std::vector<LightSource>& lights);
