#pragma once

#include <optional>
#include <vector>
#include <SDL.h>
#include "utils/blocker.hpp"

/*
  angle sweep visibility polygon for a point light among axis aligned blockers
  output is the ordered boundary (no apex), sorted by angle ascending
  the light is only emitted as a vertex when it sits on the outer boundary of
  what it can see, e.g. in a world corner
*/

struct WorldBounds {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
};

struct Segment {
    double ax, ay;
    double bx, by;
};

class VisibilityPolygon {
 public:
  static constexpr double kAngleEpsilon    = 1e-5;
  static constexpr double kParallelEpsilon = 1e-9;
  static constexpr double kMergeDistance   = 1e-6;
  static constexpr double kApexGap         = 1e-3;

  static std::vector<SDL_FPoint> compute(float light_x,
                                         float light_y,
                                         const std::vector<Blocker>& blockers,
                                         const WorldBounds& bounds);

  // Even-odd rule. Fewer than 3 points never contains anything.
  static bool contains(const std::vector<SDL_FPoint>& polygon, float x, float y);

  // Distance t along the unit ray (dx, dy) to the segment, nullopt when
  // parallel, behind or at the origin, or outside the segment.
  static std::optional<double> ray_hit(double ox, double oy,
                                       double dx, double dy,
                                       const Segment& seg);

  static void append_rect_segments(float x, float y, float w, float h, std::vector<Segment>& out);
};

inline bool point_in_polygon(float x, float y, const std::vector<SDL_FPoint>& polygon) {
    return VisibilityPolygon::contains(polygon, x, y);
}
