#include "discovery_engine.hpp"
#include "geometry/visibility_polygon.hpp"
#include "utils/discovery_grid.hpp"
#include "utils/light_falloff.hpp"
#include <algorithm>
#include <cmath>

namespace {

bool request_is_degenerate(const DiscoveryRequest& r) {
    return r.rows <= 0 || r.cols <= 0 ||
           !(r.cell_size > 0.0f) || !std::isfinite(r.cell_size) ||
           !std::isfinite(r.intensity_threshold);
}

bool inside_any_blocker(const std::vector<Blocker>& blockers, float x, float y) {
    for (const auto& b : blockers) {
        if (is_valid_blocker(b) && b.contains(x, y)) return true;
    }
    return false;
}

float light_term(const DiscoveryLight& light, float x, float y) {
    if (!(light.radius > 0.0f) || !std::isfinite(light.intensity)) return 0.0f;
    const float d = Falloff::distance(light.x, light.y, x, y);
    if (d >= light.radius) return 0.0f;
    return light.intensity * Falloff::cosine(d, light.radius);
}

}

float DiscoveryEngine::sample_level(const DiscoveryRequest& request, float x, float y) {
    if (inside_any_blocker(request.blockers, x, y)) {
        return request.ambient * (1.0f - request.blocker_opacity);
    }
    float level = request.ambient;
    for (const auto& light : request.lights) {
        level += light_term(light, x, y);
    }
    return std::min(level, 1.0f);
}

DiscoveryResponse DiscoveryEngine::compute_visible_cells(const DiscoveryRequest& request) {
    DiscoveryResponse response;
    response.sequence = request.sequence;
    if (request.lights.empty() || request_is_degenerate(request)) {
        return response;
    }

    const bool exact = request.occlusion == OcclusionMode::VisibilityPolygon;
    std::vector<std::vector<SDL_FPoint>> polygons;
    if (exact) {
        WorldBounds bounds{ 0.0f, 0.0f,
                            request.world_width > 0.0f ? request.world_width : request.cols * request.cell_size,
                            request.world_height > 0.0f ? request.world_height : request.rows * request.cell_size };
        polygons.reserve(request.lights.size());
        for (const auto& light : request.lights) {
            polygons.push_back(VisibilityPolygon::compute(light.x, light.y, request.blockers, bounds));
        }
    }

    for (int row = 0; row < request.rows; ++row) {
        for (int col = 0; col < request.cols; ++col) {
            const float cx = col * request.cell_size + request.cell_size * 0.5f;
            const float cy = row * request.cell_size + request.cell_size * 0.5f;

            float level = 0.0f;
            if (inside_any_blocker(request.blockers, cx, cy)) {
                level = request.ambient * (1.0f - request.blocker_opacity);
            } else {
                level = request.ambient;
                for (size_t i = 0; i < request.lights.size(); ++i) {
                    const float term = light_term(request.lights[i], cx, cy);
                    if (term <= 0.0f) continue;
                    if (exact && !VisibilityPolygon::contains(polygons[i], cx, cy)) continue;
                    level += term;
                }
                level = std::min(level, 1.0f);
            }

            if (level >= request.intensity_threshold) {
                response.visible.push_back(DiscoveryGrid::make_key(col, row));
            }
        }
    }
    return response;
}
