#pragma once

#include <vector>
#include "utils/light_source.hpp"

/*
  radial falloff and point light level helpers
  shared by the compositor and the discovery sampler
*/

class Falloff {
 public:

  // cos(min(d/r,1) * pi/2); exactly 0 at d >= r and for r <= 0
  static float cosine(float distance, float radius);

  static float distance(float ax, float ay, float bx, float by);

  // 1 + amount * sin(time * speed * 10)
  static float flicker_scale(const Flicker& flicker, float time);

  // intensity modulated by the light's own flicker, or by fallback when the
  // light carries none; clamped to [0,1]
  static float effective_intensity(const LightSource& light, float time, const Flicker* fallback = nullptr);

  static float contribution(const LightSource& light, float x, float y, float time = 0.0f);

  // ambient plus every light's contribution, clamped to 1
  static float light_level_at(float x, float y,
                              const std::vector<LightSource>& lights,
                              float ambient,
                              float time = 0.0f);
};
