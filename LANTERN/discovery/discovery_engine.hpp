#pragma once

#include "discovery/discovery_types.hpp"

/*
  per cell discovery sampler
  pure: same request always yields the same visible list, in row major order
*/

class DiscoveryEngine {
 public:
  static DiscoveryResponse compute_visible_cells(const DiscoveryRequest& request);

  // Light level at a point with containment occlusion.
  static float sample_level(const DiscoveryRequest& request, float x, float y);
};
