#include "shadow_frame.hpp"
#include "geometry/visibility_polygon.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace {

struct PixelSpan {
    int x0, y0, x1, y1;
};

PixelSpan clip_span(float min_x, float min_y, float max_x, float max_y, int w, int h) {
    PixelSpan s;
    s.x0 = std::max(0, static_cast<int>(std::floor(min_x)));
    s.y0 = std::max(0, static_cast<int>(std::floor(min_y)));
    s.x1 = std::min(w - 1, static_cast<int>(std::ceil(max_x)));
    s.y1 = std::min(h - 1, static_cast<int>(std::ceil(max_y)));
    return s;
}

Uint8 to_byte(float v) {
    return static_cast<Uint8>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

}

ShadowFrame::ShadowFrame(int width, int height) {
    resize(width, height);
}

void ShadowFrame::resize(int width, int height) {
    width_ = std::max(0, width);
    height_ = std::max(0, height);
    const size_t n = static_cast<size_t>(width_) * static_cast<size_t>(height_);
    darkness_.assign(n, 0.0f);
    glow_.assign(n, 0.0f);
}

void ShadowFrame::fill(float darkness) {
    std::fill(darkness_.begin(), darkness_.end(), std::clamp(darkness, 0.0f, 1.0f));
}

void ShadowFrame::clear_glow() {
    std::fill(glow_.begin(), glow_.end(), 0.0f);
}

void ShadowFrame::erase_radial(float cx, float cy, float radius, float intensity) {
    if (empty() || !(radius > 0.0f) || !(intensity > 0.0f)) return;
    const float k = std::min(intensity, 1.0f);
    const PixelSpan s = clip_span(cx - radius, cy - radius, cx + radius, cy + radius, width_, height_);
    for (int y = s.y0; y <= s.y1; ++y) {
        const float py = y + 0.5f - cy;
        for (int x = s.x0; x <= s.x1; ++x) {
            const float px = x + 0.5f - cx;
            const float d = std::sqrt(px * px + py * py);
            if (d >= radius) continue;
            const float erase = ShadowGeometry::radial_erase(d / radius) * k;
            float& dark = darkness_[idx(x, y)];
            dark *= (1.0f - erase);
        }
    }
}

void ShadowFrame::add_glow(float cx, float cy, float radius, float opacity) {
    if (empty() || !(radius > 0.0f) || !(opacity > 0.0f)) return;
    const PixelSpan s = clip_span(cx - radius, cy - radius, cx + radius, cy + radius, width_, height_);
    for (int y = s.y0; y <= s.y1; ++y) {
        const float py = y + 0.5f - cy;
        for (int x = s.x0; x <= s.x1; ++x) {
            const float px = x + 0.5f - cx;
            const float d = std::sqrt(px * px + py * py);
            if (d >= radius) continue;
            const float falloff = 1.0f - d / radius;
            float& g = glow_[idx(x, y)];
            g = std::min(1.0f, g + opacity * falloff);
        }
    }
}

void ShadowFrame::apply_shadow(const ShadowQuad& quad) {
    if (empty() || quad.near_alpha <= 0.0f) return;
    const std::vector<SDL_FPoint> poly{ quad.near_a, quad.near_b, quad.far_b, quad.far_a };
    float min_x = poly[0].x, max_x = poly[0].x;
    float min_y = poly[0].y, max_y = poly[0].y;
    for (const auto& p : poly) {
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }
    const PixelSpan s = clip_span(min_x, min_y, max_x, max_y, width_, height_);
    for (int y = s.y0; y <= s.y1; ++y) {
        const float py = y + 0.5f;
        for (int x = s.x0; x <= s.x1; ++x) {
            const float px = x + 0.5f;
            if (!point_in_polygon(px, py, poly)) continue;
            const float a = quad.alpha_at(quad.gradient_t(px, py));
            if (a <= 0.0f) continue;
            float& dark = darkness_[idx(x, y)];
            dark = a + dark * (1.0f - a);
        }
    }
}

float ShadowFrame::darkness_at(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return 0.0f;
    return darkness_[idx(x, y)];
}

float ShadowFrame::glow_at(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return 0.0f;
    return glow_[idx(x, y)];
}

void ShadowFrame::write_darkness(void* pixels, int pitch) const {
    if (!pixels) return;
    for (int y = 0; y < height_; ++y) {
        auto* row = static_cast<std::uint8_t*>(pixels) + static_cast<size_t>(y) * static_cast<size_t>(pitch);
        for (int x = 0; x < width_; ++x) {
            std::uint8_t* px = row + x * 4;
            px[0] = 0;
            px[1] = 0;
            px[2] = 0;
            px[3] = to_byte(darkness_[idx(x, y)]);
        }
    }
}

void ShadowFrame::write_glow(void* pixels, int pitch, SDL_Color tint) const {
    if (!pixels) return;
    for (int y = 0; y < height_; ++y) {
        auto* row = static_cast<std::uint8_t*>(pixels) + static_cast<size_t>(y) * static_cast<size_t>(pitch);
        for (int x = 0; x < width_; ++x) {
            const float g = glow_[idx(x, y)];
            std::uint8_t* px = row + x * 4;
            px[0] = to_byte(g * tint.r / 255.0f);
            px[1] = to_byte(g * tint.g / 255.0f);
            px[2] = to_byte(g * tint.b / 255.0f);
            px[3] = to_byte(g);
        }
    }
}
