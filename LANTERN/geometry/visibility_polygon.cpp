#include "visibility_polygon.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace {

struct Candidate {
    double angle;
    double vx;
    double vy;
};

struct Hit {
    double angle;
    double x;
    double y;
};

void append_rect_vertices(float x, float y, float w, float h, std::vector<SDL_FPoint>& out) {
    out.push_back(SDL_FPoint{ x, y });
    out.push_back(SDL_FPoint{ x + w, y });
    out.push_back(SDL_FPoint{ x + w, y + h });
    out.push_back(SDL_FPoint{ x, y + h });
}

bool same_point(const Hit& a, const Hit& b) {
    return std::abs(a.x - b.x) < VisibilityPolygon::kMergeDistance &&
           std::abs(a.y - b.y) < VisibilityPolygon::kMergeDistance;
}

}

std::optional<double> VisibilityPolygon::ray_hit(double ox, double oy,
                                                 double dx, double dy,
                                                 const Segment& seg) {
    const double ex = seg.bx - seg.ax;
    const double ey = seg.by - seg.ay;
    const double denom = dx * ey - dy * ex;
    if (std::abs(denom) < kParallelEpsilon) return std::nullopt;

    const double px = seg.ax - ox;
    const double py = seg.ay - oy;
    const double t = (px * ey - py * ex) / denom;
    const double u = (px * dy - py * dx) / denom;
    // a light lying on a segment must see past it, not stop at its own position
    if (t <= kMergeDistance) return std::nullopt;
    if (u < 0.0 || u > 1.0) return std::nullopt;
    return t;
}

void VisibilityPolygon::append_rect_segments(float x, float y, float w, float h, std::vector<Segment>& out) {
    const double x0 = x, y0 = y, x1 = x + w, y1 = y + h;
    out.push_back(Segment{ x0, y0, x1, y0 });
    out.push_back(Segment{ x1, y0, x1, y1 });
    out.push_back(Segment{ x1, y1, x0, y1 });
    out.push_back(Segment{ x0, y1, x0, y0 });
}

std::vector<SDL_FPoint> VisibilityPolygon::compute(float light_x,
                                                   float light_y,
                                                   const std::vector<Blocker>& blockers,
                                                   const WorldBounds& bounds) {
    std::vector<SDL_FPoint> result;
    if (!std::isfinite(light_x) || !std::isfinite(light_y)) return result;
    if (!(bounds.width > 0.0f) || !(bounds.height > 0.0f)) return result;

    std::vector<Segment> segments;
    std::vector<SDL_FPoint> vertices;
    segments.reserve(4 + blockers.size() * 4);
    vertices.reserve(4 + blockers.size() * 4);

    append_rect_segments(bounds.x, bounds.y, bounds.width, bounds.height, segments);
    append_rect_vertices(bounds.x, bounds.y, bounds.width, bounds.height, vertices);
    for (const auto& b : blockers) {
        if (!is_valid_blocker(b)) continue;
        append_rect_segments(b.x, b.y, b.width, b.height, segments);
        append_rect_vertices(b.x, b.y, b.width, b.height, vertices);
    }

    const double lx = light_x;
    const double ly = light_y;

    std::vector<Candidate> candidates;
    candidates.reserve(vertices.size() * 3);
    for (const auto& v : vertices) {
        const double a = std::atan2(v.y - ly, v.x - lx);
        candidates.push_back(Candidate{ a - kAngleEpsilon, v.x, v.y });
        candidates.push_back(Candidate{ a, v.x, v.y });
        candidates.push_back(Candidate{ a + kAngleEpsilon, v.x, v.y });
    }

    std::vector<Hit> hits;
    hits.reserve(candidates.size());
    for (const auto& c : candidates) {
        const double dx = std::cos(c.angle);
        const double dy = std::sin(c.angle);
        double best = std::numeric_limits<double>::infinity();
        for (const auto& seg : segments) {
            if (auto t = ray_hit(lx, ly, dx, dy, seg)) {
                best = std::min(best, *t);
            }
        }
        if (!std::isfinite(best)) continue;

        Hit h{ c.angle, lx + dx * best, ly + dy * best };
        // the eps rays land beside the vertex that spawned them; pull them onto it
        const double vd = std::hypot(c.vx - lx, c.vy - ly);
        const double snap = std::max(kMergeDistance, vd * kAngleEpsilon * 4.0) + 1e-9;
        if (std::hypot(h.x - c.vx, h.y - c.vy) <= snap) {
            h.x = c.vx;
            h.y = c.vy;
        }
        hits.push_back(h);
    }

    std::stable_sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
        return a.angle < b.angle;
    });

    std::vector<Hit> merged;
    merged.reserve(hits.size());
    for (const auto& h : hits) {
        if (!merged.empty() && same_point(merged.back(), h)) continue;
        merged.push_back(h);
    }
    while (merged.size() > 1 && same_point(merged.front(), merged.back())) {
        merged.pop_back();
    }

    // A light on the outer boundary (a world corner, say) sees less than a half
    // turn; the light itself then closes the fan across the empty gap.
    std::size_t apex_at = merged.size() + 1;
    if (merged.size() >= 2) {
        const double pi = std::acos(-1.0);
        double widest = merged.front().angle + 2.0 * pi - merged.back().angle;
        std::size_t gap_end = merged.size();
        for (std::size_t i = 1; i < merged.size(); ++i) {
            const double gap = merged[i].angle - merged[i - 1].angle;
            if (gap > widest) {
                widest = gap;
                gap_end = i;
            }
        }
        if (widest > pi + kApexGap) apex_at = gap_end;
    }

    result.reserve(merged.size() + 1);
    for (std::size_t i = 0; i < merged.size(); ++i) {
        if (i == apex_at) result.push_back(SDL_FPoint{ light_x, light_y });
        result.push_back(SDL_FPoint{ static_cast<float>(merged[i].x), static_cast<float>(merged[i].y) });
    }
    if (apex_at == merged.size()) result.push_back(SDL_FPoint{ light_x, light_y });
    return result;
}

bool VisibilityPolygon::contains(const std::vector<SDL_FPoint>& polygon, float x, float y) {
    if (polygon.size() < 3) return false;
    bool inside = false;
    for (size_t i = 0, j = polygon.size() - 1; i < polygon.size(); j = i++) {
        const float xi = polygon[i].x, yi = polygon[i].y;
        const float xj = polygon[j].x, yj = polygon[j].y;
        const bool crosses = (yi > y) != (yj > y);
        if (crosses && x < (xj - xi) * (y - yi) / (yj - yi) + xi) {
            inside = !inside;
        }
    }
    return inside;
}
