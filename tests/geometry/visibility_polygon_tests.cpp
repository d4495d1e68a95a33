#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "geometry/visibility_polygon.hpp"

#include <cmath>
#include <vector>

namespace {

Blocker rect(float x, float y, float w, float h) {
    Blocker b;
    b.x = x;
    b.y = y;
    b.width = w;
    b.height = h;
    return b;
}

double polygon_area(const std::vector<SDL_FPoint>& poly) {
    double twice = 0.0;
    for (size_t i = 0, j = poly.size() - 1; i < poly.size(); j = i++) {
        twice += static_cast<double>(poly[j].x) * poly[i].y - static_cast<double>(poly[i].x) * poly[j].y;
    }
    return std::abs(twice) * 0.5;
}

bool angles_ascending(const std::vector<SDL_FPoint>& poly, float lx, float ly) {
    double last = -10.0;
    for (const auto& p : poly) {
        const double a = std::atan2(p.y - ly, p.x - lx);
        if (a < last - 1e-6) return false;
        last = a;
    }
    return true;
}

}

TEST_CASE("no blockers yields exactly the four bounds corners in angle order") {
    const WorldBounds bounds{ 0.0f, 0.0f, 400.0f, 300.0f };
    const auto poly = VisibilityPolygon::compute(100.0f, 100.0f, {}, bounds);
    REQUIRE(poly.size() == 4);
    CHECK(poly[0].x == doctest::Approx(0.0f));
    CHECK(poly[0].y == doctest::Approx(0.0f));
    CHECK(poly[1].x == doctest::Approx(400.0f));
    CHECK(poly[1].y == doctest::Approx(0.0f));
    CHECK(poly[2].x == doctest::Approx(400.0f));
    CHECK(poly[2].y == doctest::Approx(300.0f));
    CHECK(poly[3].x == doctest::Approx(0.0f));
    CHECK(poly[3].y == doctest::Approx(300.0f));
}

TEST_CASE("a blocker hides the region behind it") {
    const WorldBounds bounds{ 0.0f, 0.0f, 400.0f, 300.0f };
    const std::vector<Blocker> blockers{ rect(200.0f, 80.0f, 20.0f, 40.0f) };
    const auto poly = VisibilityPolygon::compute(100.0f, 100.0f, blockers, bounds);
    REQUIRE(poly.size() > 4);
    CHECK(angles_ascending(poly, 100.0f, 100.0f));

    CHECK(point_in_polygon(150.0f, 100.0f, poly));
    CHECK(point_in_polygon(50.0f, 250.0f, poly));
    CHECK_FALSE(point_in_polygon(350.0f, 100.0f, poly));
    CHECK(point_in_polygon(350.0f, 20.0f, poly));
}

TEST_CASE("light on a world edge sees the whole world") {
    const WorldBounds bounds{ 0.0f, 0.0f, 500.0f, 500.0f };
    const auto poly = VisibilityPolygon::compute(0.0f, 250.0f, {}, bounds);
    REQUIRE(poly.size() == 4);
    CHECK(polygon_area(poly) == doctest::Approx(250000.0));
    CHECK(point_in_polygon(100.0f, 250.0f, poly));
    CHECK(point_in_polygon(400.0f, 50.0f, poly));
    CHECK(point_in_polygon(450.0f, 480.0f, poly));
}

TEST_CASE("light in a world corner closes the fan at itself") {
    const WorldBounds bounds{ 0.0f, 0.0f, 500.0f, 500.0f };
    const auto poly = VisibilityPolygon::compute(0.0f, 0.0f, {}, bounds);
    REQUIRE(poly.size() >= 4);
    CHECK(polygon_area(poly) == doctest::Approx(250000.0).epsilon(0.001));
    CHECK(point_in_polygon(10.0f, 10.0f, poly));
    CHECK(point_in_polygon(250.0f, 250.0f, poly));
    CHECK(point_in_polygon(490.0f, 20.0f, poly));
}

TEST_CASE("light on a blocker edge sees away from the blocker") {
    const WorldBounds bounds{ 0.0f, 0.0f, 200.0f, 200.0f };
    const std::vector<Blocker> blockers{ rect(100.0f, 50.0f, 20.0f, 20.0f) };
    const auto poly = VisibilityPolygon::compute(100.0f, 60.0f, blockers, bounds);
    REQUIRE(poly.size() >= 3);
    CHECK(polygon_area(poly) > 19000.0);
    CHECK(point_in_polygon(50.0f, 60.0f, poly));
    CHECK(point_in_polygon(50.0f, 150.0f, poly));
    CHECK(point_in_polygon(20.0f, 20.0f, poly));
    CHECK_FALSE(point_in_polygon(160.0f, 60.0f, poly));
}

TEST_CASE("ray_hit rejects parallel, behind and off-segment hits") {
    const Segment vertical{ 10.0, -5.0, 10.0, 5.0 };
    auto t = VisibilityPolygon::ray_hit(0.0, 0.0, 1.0, 0.0, vertical);
    REQUIRE(t.has_value());
    CHECK(*t == doctest::Approx(10.0));

    CHECK_FALSE(VisibilityPolygon::ray_hit(0.0, 0.0, -1.0, 0.0, vertical).has_value());
    CHECK_FALSE(VisibilityPolygon::ray_hit(0.0, 0.0, 0.0, 1.0, vertical).has_value());
    CHECK_FALSE(VisibilityPolygon::ray_hit(0.0, 20.0, 1.0, 0.0, vertical).has_value());
    CHECK_FALSE(VisibilityPolygon::ray_hit(10.0, 0.0, 1.0, 0.0, vertical).has_value());
}

TEST_CASE("point_in_polygon uses the even-odd rule") {
    const std::vector<SDL_FPoint> square{ {0, 0}, {10, 0}, {10, 10}, {0, 10} };
    CHECK(point_in_polygon(5.0f, 5.0f, square));
    CHECK_FALSE(point_in_polygon(15.0f, 5.0f, square));
    CHECK_FALSE(point_in_polygon(5.0f, 5.0f, { {0, 0}, {10, 0} }));
}

TEST_CASE("degenerate bounds give an empty polygon") {
    CHECK(VisibilityPolygon::compute(1.0f, 1.0f, {}, WorldBounds{ 0, 0, 0, 10 }).empty());
    CHECK(VisibilityPolygon::compute(std::nanf(""), 1.0f, {}, WorldBounds{ 0, 0, 10, 10 }).empty());
}
