#pragma once

#include <optional>
#include <SDL.h>
#include "utils/blocker.hpp"

/*
  pure shadow math, all in one coordinate space (the caller picks raster or world)
*/

struct ShadowQuad {
    SDL_FPoint near_a;
    SDL_FPoint near_b;
    SDL_FPoint far_b;
    SDL_FPoint far_a;
    float near_alpha = 0.0f;

    // t is 0 on the near edge and 1 on the far edge.
    float alpha_at(float t) const;

    // Projection of (x, y) on the near-mid to far-mid axis, clamped to [0,1].
    float gradient_t(float x, float y) const;
};

class ShadowGeometry {
 public:
  static float shadow_length(float tile_screen_size, int cast_height);
  static float shadow_strength(int softness, float light_intensity, float darkness);
  static float near_edge_alpha(float strength);

  // Erase amount at normalized distance t from a light's center.
  static float radial_erase(float t);

  // nullopt when the light sits inside (or on) the blocker.
  static std::optional<ShadowQuad> compute_quad(float light_x,
                                                float light_y,
                                                float light_intensity,
                                                const Blocker& blocker,
                                                float tile_screen_size,
                                                float darkness,
                                                SDL_FPoint far_jitter = SDL_FPoint{0.0f, 0.0f});

  // Per pair offset that only changes with the frame bucket.
  static SDL_FPoint jitter(float elapsed, int pair_index, float amplitude);
};
