#include "light_source.hpp"
#include <algorithm>
#include <cmath>

LightSource sanitize_light(const LightSource& light) {
        LightSource out = light;
        if (!std::isfinite(out.x)) out.x = 0.0f;
        if (!std::isfinite(out.y)) out.y = 0.0f;
        out.radius    = std::isfinite(out.radius) ? std::max(0.0f, out.radius) : 0.0f;
        out.intensity = std::isfinite(out.intensity) ? std::clamp(out.intensity, 0.0f, 1.0f) : 0.0f;
        if (!std::isfinite(out.flicker.speed))  out.flicker.speed = 0.0f;
        if (!std::isfinite(out.flicker.amount)) out.flicker.amount = 0.0f;
        out.flicker.amount = std::clamp(out.flicker.amount, 0.0f, 1.0f);
        return out;
}

std::vector<LightSource> sanitize_lights(const std::vector<LightSource>& lights) {
        std::vector<LightSource> out;
        out.reserve(lights.size());
        for (const auto& l : lights) {
                out.push_back(sanitize_light(l));
        }
        return out;
}
