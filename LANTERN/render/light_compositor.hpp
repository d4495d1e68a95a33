#pragma once

#include <SDL.h>
#include "core/lighting_config.hpp"
#include "lighting/lighting_snapshot.hpp"
#include "render/shadow_frame.hpp"

/*
  layers ambient darkness, light erasure, glow halos and blocker shadows into a
  low resolution raster, then streams it to the renderer
*/

class LightCompositor {

	public:
    explicit LightCompositor(const LightingConfig& config);
    ~LightCompositor();

    LightCompositor(const LightCompositor&) = delete;
    LightCompositor& operator=(const LightCompositor&) = delete;

    const ShadowFrame& compose(const LightingSnapshot& snapshot, int viewport_w, int viewport_h);

    // Draws the last composed frame. A texture failure disables the
    // compositor; the rest of the scene keeps drawing.
    bool present(SDL_Renderer* renderer);

    bool enabled() const { return enabled_; }
    void set_enabled(bool enabled) { enabled_ = enabled; }
    void set_debugging(bool debugging) { debugging_ = debugging; }

    const ShadowFrame& frame() const { return frame_; }
    int downscale() const { return downscale_; }
    int shadows_drawn() const { return shadows_drawn_; }
    void release_textures();

	private:
    bool ensure_textures(SDL_Renderer* renderer, int w, int h);
    SDL_Texture* create_stream_texture(SDL_Renderer* renderer, int w, int h, SDL_BlendMode mode);
    bool upload(SDL_Texture* tex, bool glow_layer);

	private:
    int downscale_ = 2;
    float glow_radius_ = 22.0f;
    float glow_opacity_ = 0.35f;
    float shadow_jitter_ = 1.5f;
    bool debugging_ = false;
    bool enabled_ = true;
    int shadows_drawn_ = 0;
    SDL_Color glow_tint_{127, 219, 202, 255};

    ShadowFrame frame_;
    SDL_Renderer* tex_owner_ = nullptr;
    SDL_Texture* darkness_tex_ = nullptr;
    SDL_Texture* glow_tex_ = nullptr;
    int tex_w_ = 0;
    int tex_h_ = 0;
};
