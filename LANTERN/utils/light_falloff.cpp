#include "light_falloff.hpp"

#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

float Falloff::distance(float ax, float ay, float bx, float by) {
    const float dx = ax - bx;
    const float dy = ay - by;
    return std::sqrt(dx * dx + dy * dy);
}

float Falloff::cosine(float distance, float radius) {
    if (!(radius > 0.0f) || !std::isfinite(distance)) return 0.0f;
    if (distance >= radius) return 0.0f;
    const float t = std::clamp(distance / radius, 0.0f, 1.0f);
    return std::clamp(static_cast<float>(std::cos(t * M_PI * 0.5)), 0.0f, 1.0f);
}

float Falloff::flicker_scale(const Flicker& flicker, float time) {
    if (!flicker.enabled) return 1.0f;
    return 1.0f + flicker.amount * std::sin(time * flicker.speed * 10.0f);
}

float Falloff::effective_intensity(const LightSource& light, float time, const Flicker* fallback) {
    float intensity = light.intensity;
    if (light.has_flicker && light.flicker.enabled) {
        intensity *= flicker_scale(light.flicker, time);
    } else if (fallback) {
        intensity *= flicker_scale(*fallback, time);
    }
    if (!std::isfinite(intensity)) return 0.0f;
    return std::clamp(intensity, 0.0f, 1.0f);
}

float Falloff::contribution(const LightSource& light, float x, float y, float time) {
    const float d = distance(x, y, light.x, light.y);
    const float f = cosine(d, light.radius);
    if (f <= 0.0f) return 0.0f;
    return effective_intensity(light, time) * f;
}

float Falloff::light_level_at(float x, float y,
                              const std::vector<LightSource>& lights,
                              float ambient,
                              float time) {
    float total = std::clamp(ambient, 0.0f, 1.0f);
    for (const auto& light : lights) {
        total = std::min(1.0f, total + contribution(light, x, y, time));
    }
    return total;
}
