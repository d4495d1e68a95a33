#pragma once

#include <vector>
#include <SDL.h>
#include "render/shadow_geometry.hpp"

/*
  cpu raster for one lighting frame
  darkness is the alpha of a black overlay, glow is an additive layer
*/

class ShadowFrame {

	public:
    ShadowFrame() = default;
    ShadowFrame(int width, int height);

    void resize(int width, int height);
    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return width_ <= 0 || height_ <= 0; }

    void fill(float darkness);
    void clear_glow();

    // darkness *= 1 - radial_erase(d / radius) * intensity
    void erase_radial(float cx, float cy, float radius, float intensity);

    // Linear falloff halo, ignores darkness and blockers.
    void add_glow(float cx, float cy, float radius, float opacity);

    // Gradient alpha composited over darkness inside the quad.
    void apply_shadow(const ShadowQuad& quad);

    float darkness_at(int x, int y) const;
    float glow_at(int x, int y) const;

    // RGBA32 byte order, one row every pitch bytes.
    void write_darkness(void* pixels, int pitch) const;
    void write_glow(void* pixels, int pitch, SDL_Color tint) const;

	private:
    int idx(int x, int y) const { return y * width_ + x; }

	private:
    int width_ = 0;
    int height_ = 0;
    std::vector<float> darkness_;
    std::vector<float> glow_;
};
