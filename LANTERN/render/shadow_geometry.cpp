#include "shadow_geometry.hpp"
#include "utils/seeded_random.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace {

constexpr float kMinShadowScale   = 0.25f;
constexpr float kMaxShadowScale   = 3.0f;
constexpr float kJitterBucketsPerSecond = 12.0f;

struct ErasePoint {
    float t;
    float value;
};

constexpr ErasePoint kEraseStops[] = {
    { 0.00f, 1.00f },
    { 0.45f, 0.60f },
    { 0.75f, 0.25f },
    { 1.00f, 0.00f },
};

SDL_FPoint extend_from(float lx, float ly, SDL_FPoint p, float length) {
    const float dx = p.x - lx;
    const float dy = p.y - ly;
    const float len = std::sqrt(dx * dx + dy * dy);
    if (len <= 0.0f) return p;
    return SDL_FPoint{ p.x + dx / len * length, p.y + dy / len * length };
}

}

float ShadowQuad::alpha_at(float t) const {
    const float c = std::clamp(t, 0.0f, 1.0f);
    return std::max(0.0f, near_alpha * (1.0f - c));
}

float ShadowQuad::gradient_t(float x, float y) const {
    const float nx = (near_a.x + near_b.x) * 0.5f;
    const float ny = (near_a.y + near_b.y) * 0.5f;
    const float fx = (far_a.x + far_b.x) * 0.5f;
    const float fy = (far_a.y + far_b.y) * 0.5f;
    const float ax = fx - nx;
    const float ay = fy - ny;
    const float len2 = ax * ax + ay * ay;
    if (len2 <= 0.0f) return 0.0f;
    return std::clamp(((x - nx) * ax + (y - ny) * ay) / len2, 0.0f, 1.0f);
}

float ShadowGeometry::shadow_length(float tile_screen_size, int cast_height) {
    const int ch = std::clamp(cast_height, 1, 9);
    const float scale = kMinShadowScale + (static_cast<float>(ch - 1) / 8.0f) * (kMaxShadowScale - kMinShadowScale);
    return std::max(0.0f, tile_screen_size) * scale;
}

float ShadowGeometry::shadow_strength(int softness, float light_intensity, float darkness) {
    const int s = std::clamp(softness, 1, 9);
    return (static_cast<float>(s) / 9.0f) * std::max(0.25f, light_intensity) * (0.6f + darkness * 0.8f);
}

float ShadowGeometry::near_edge_alpha(float strength) {
    return std::clamp(0.12f + strength * 0.55f, 0.0f, 1.0f);
}

float ShadowGeometry::radial_erase(float t) {
    if (!(t >= 0.0f)) return kEraseStops[0].value;
    if (t >= 1.0f) return 0.0f;
    for (size_t i = 1; i < sizeof(kEraseStops) / sizeof(kEraseStops[0]); ++i) {
        const ErasePoint& a = kEraseStops[i - 1];
        const ErasePoint& b = kEraseStops[i];
        if (t <= b.t) {
            const float k = (t - a.t) / (b.t - a.t);
            return a.value + (b.value - a.value) * k;
        }
    }
    return 0.0f;
}

std::optional<ShadowQuad> ShadowGeometry::compute_quad(float light_x,
                                                       float light_y,
                                                       float light_intensity,
                                                       const Blocker& blocker,
                                                       float tile_screen_size,
                                                       float darkness,
                                                       SDL_FPoint far_jitter) {
    if (!is_valid_blocker(blocker)) return std::nullopt;
    if (blocker.contains(light_x, light_y)) return std::nullopt;

    const float x0 = blocker.x;
    const float y0 = blocker.y;
    const float x1 = blocker.x + blocker.width;
    const float y1 = blocker.y + blocker.height;
    const float dx = blocker.center_x() - light_x;
    const float dy = blocker.center_y() - light_y;

    ShadowQuad quad{};
    SDL_FPoint far_a{};
    SDL_FPoint far_b{};
    if (std::abs(dx) >= std::abs(dy)) {
        const float near_x = dx >= 0.0f ? x0 : x1;
        const float far_x  = dx >= 0.0f ? x1 : x0;
        quad.near_a = SDL_FPoint{ near_x, y0 };
        quad.near_b = SDL_FPoint{ near_x, y1 };
        far_a = SDL_FPoint{ far_x, y0 };
        far_b = SDL_FPoint{ far_x, y1 };
    } else {
        const float near_y = dy >= 0.0f ? y0 : y1;
        const float far_y  = dy >= 0.0f ? y1 : y0;
        quad.near_a = SDL_FPoint{ x0, near_y };
        quad.near_b = SDL_FPoint{ x1, near_y };
        far_a = SDL_FPoint{ x0, far_y };
        far_b = SDL_FPoint{ x1, far_y };
    }

    const float length = shadow_length(tile_screen_size, blocker.cast_height);
    quad.far_a = extend_from(light_x, light_y, far_a, length);
    quad.far_b = extend_from(light_x, light_y, far_b, length);
    quad.far_a.x += far_jitter.x;
    quad.far_a.y += far_jitter.y;
    quad.far_b.x += far_jitter.x;
    quad.far_b.y += far_jitter.y;

    const float strength = shadow_strength(blocker.softness, light_intensity, darkness);
    quad.near_alpha = near_edge_alpha(strength);
    return quad;
}

SDL_FPoint ShadowGeometry::jitter(float elapsed, int pair_index, float amplitude) {
    if (!(amplitude > 0.0f) || !std::isfinite(elapsed)) return SDL_FPoint{0.0f, 0.0f};
    const uint32_t bucket = static_cast<uint32_t>(static_cast<int64_t>(std::floor(elapsed * kJitterBucketsPerSecond)));
    SeededRandom rng(bucket * 2654435761u ^ static_cast<uint32_t>(pair_index) * 40503u);
    const float jx = rng.rand_float(-amplitude, amplitude);
    const float jy = rng.rand_float(-amplitude, amplitude);
    return SDL_FPoint{ jx, jy };
}
