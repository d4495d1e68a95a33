#include "light_compositor.hpp"
#include "utils/light_falloff.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace {

constexpr float kMinDarkness = 0.2f;

Blocker to_raster(const Blocker& b, const ViewTransform& view, float inv_down) {
        Blocker out = b;
        const SDL_FPoint p = view.world_to_screen(b.x, b.y);
        out.x = p.x * inv_down;
        out.y = p.y * inv_down;
        out.width = b.width * view.scale * inv_down;
        out.height = b.height * view.scale * inv_down;
        return out;
}

}

LightCompositor::LightCompositor(const LightingConfig& config)
: downscale_(std::max(1, config.raster_downscale)),
  glow_radius_(config.glow_radius),
  glow_opacity_(config.glow_opacity),
  shadow_jitter_(config.shadow_jitter),
  debugging_(config.debugging)
{}

LightCompositor::~LightCompositor() {
        release_textures();
}

void LightCompositor::release_textures() {
        if (darkness_tex_) {
                SDL_DestroyTexture(darkness_tex_);
                darkness_tex_ = nullptr;
        }
        if (glow_tex_) {
                SDL_DestroyTexture(glow_tex_);
                glow_tex_ = nullptr;
        }
        tex_w_ = 0;
        tex_h_ = 0;
        tex_owner_ = nullptr;
}

const ShadowFrame& LightCompositor::compose(const LightingSnapshot& snapshot, int viewport_w, int viewport_h) {
        if (debugging_) std::cout << "[LightCompositor] compose start\n";
        const int low_w = std::max(1, viewport_w / downscale_);
        const int low_h = std::max(1, viewport_h / downscale_);
        if (frame_.width() != low_w || frame_.height() != low_h) {
                frame_.resize(low_w, low_h);
        }

        const float darkness = std::clamp(snapshot.ambient_darkness, kMinDarkness, 1.0f);
        frame_.fill(darkness);
        frame_.clear_glow();
        shadows_drawn_ = 0;

        const float inv_down = 1.0f / static_cast<float>(downscale_);
        const ViewTransform& view = snapshot.view;
        const float px_scale = view.scale * inv_down;

        struct RasterLight {
                float x, y, radius, intensity;
        };
        std::vector<RasterLight> lights;
        lights.reserve(snapshot.lights.size());
        for (const auto& light : sanitize_lights(snapshot.lights)) {
                const float intensity = Falloff::effective_intensity(light, snapshot.elapsed, &snapshot.global_flicker);
                if (light.radius <= 0.0f || intensity <= 0.0f) continue;
                const SDL_FPoint p = view.world_to_screen(light.x, light.y);
                lights.push_back(RasterLight{ p.x * inv_down, p.y * inv_down, light.radius * px_scale, intensity });
        }

        for (const auto& l : lights) {
                frame_.erase_radial(l.x, l.y, l.radius, l.intensity);
        }

        const float glow_r = glow_radius_ * inv_down;
        for (const auto& g : snapshot.glows) {
                const SDL_FPoint p = view.world_to_screen(g.x, g.y);
                frame_.add_glow(p.x * inv_down, p.y * inv_down, glow_r, glow_opacity_);
        }

        const float tile_px = snapshot.tile_size * px_scale;
        const float jitter_px = shadow_jitter_ * inv_down;
        int pair_index = 0;
        for (const auto& l : lights) {
                for (const auto& b : snapshot.blockers) {
                        const int pair = pair_index++;
                        auto clean = sanitize_blocker(b);
                        if (!clean) continue;
                        const Blocker rb = to_raster(*clean, view, inv_down);
                        const float reach = l.radius + std::max(rb.width, rb.height);
                        if (Falloff::distance(l.x, l.y, rb.center_x(), rb.center_y()) > reach) continue;
                        const SDL_FPoint jit = ShadowGeometry::jitter(snapshot.elapsed, pair, jitter_px);
                        auto quad = ShadowGeometry::compute_quad(l.x, l.y, l.intensity, rb, tile_px, darkness, jit);
                        if (!quad) continue;
                        frame_.apply_shadow(*quad);
                        ++shadows_drawn_;
                }
        }

        if (debugging_) {
                std::cout << "[LightCompositor] compose end: " << lights.size() << " lights, "
                          << shadows_drawn_ << " shadows\n";
        }
        return frame_;
}

SDL_Texture* LightCompositor::create_stream_texture(SDL_Renderer* renderer, int w, int h, SDL_BlendMode mode) {
        SDL_Texture* tex = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING, w, h);
        if (!tex) {
                std::cerr << "[LightCompositor] Failed to create " << w << "x" << h
                          << " texture: " << SDL_GetError() << "\n";
                return nullptr;
        }
        SDL_SetTextureBlendMode(tex, mode);
#if SDL_VERSION_ATLEAST(2,0,12)
        SDL_SetTextureScaleMode(tex, SDL_ScaleModeLinear);
#endif
        return tex;
}

bool LightCompositor::ensure_textures(SDL_Renderer* renderer, int w, int h) {
        if (w <= 0 || h <= 0) {
                return false;
        }
        if (tex_owner_ != renderer || tex_w_ != w || tex_h_ != h) {
                release_textures();
        }
        if (!darkness_tex_) {
                darkness_tex_ = create_stream_texture(renderer, w, h, SDL_BLENDMODE_BLEND);
        }
        if (!glow_tex_) {
                glow_tex_ = create_stream_texture(renderer, w, h, SDL_BLENDMODE_ADD);
        }
        if (!darkness_tex_ || !glow_tex_) {
                release_textures();
                return false;
        }
        tex_owner_ = renderer;
        tex_w_ = w;
        tex_h_ = h;
        return true;
}

bool LightCompositor::upload(SDL_Texture* tex, bool glow_layer) {
        void* pixels = nullptr;
        int pitch = 0;
        if (SDL_LockTexture(tex, nullptr, &pixels, &pitch) != 0) {
                std::cerr << "[LightCompositor] SDL_LockTexture failed: " << SDL_GetError() << "\n";
                return false;
        }
        if (glow_layer) {
                frame_.write_glow(pixels, pitch, glow_tint_);
        } else {
                frame_.write_darkness(pixels, pitch);
        }
        SDL_UnlockTexture(tex);
        return true;
}

bool LightCompositor::present(SDL_Renderer* renderer) {
        if (!enabled_ || !renderer || frame_.empty()) {
                return false;
        }
        if (!ensure_textures(renderer, frame_.width(), frame_.height()) ||
            !upload(darkness_tex_, false) ||
            !upload(glow_tex_, true)) {
                std::cerr << "[LightCompositor] Disabling lighting overlay\n";
                release_textures();
                enabled_ = false;
                return false;
        }
        SDL_RenderCopy(renderer, darkness_tex_, nullptr, nullptr);
        SDL_RenderCopy(renderer, glow_tex_, nullptr, nullptr);
        return true;
}
