#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "render/light_compositor.hpp"
#include "render/lighting_scene.hpp"

#include <SDL.h>

#include <chrono>
#include <memory>
#include <stdexcept>

using namespace std::chrono_literals;

namespace {
class SDLSubsystemGuard {
public:
    SDLSubsystemGuard() {
        SDL_SetHint(SDL_HINT_VIDEODRIVER, "dummy");
        if (SDL_Init(SDL_INIT_VIDEO) != 0) {
            throw std::runtime_error(SDL_GetError());
        }
    }

    ~SDLSubsystemGuard() {
        SDL_Quit();
    }
};

SDLSubsystemGuard& ensure_sdl() {
    static SDLSubsystemGuard guard;
    return guard;
}

LightingConfig flat_config() {
    LightingConfig config;
    config.raster_downscale = 1;
    config.shadow_jitter = 0.0f;
    return config;
}

LightingSnapshot dark_snapshot(float ambient) {
    LightingSnapshot snap;
    snap.ambient_darkness = ambient;
    snap.global_flicker.enabled = false;
    snap.tile_size = 10.0f;
    return snap;
}

LightSource light_at(float x, float y, float radius) {
    LightSource l;
    l.x = x;
    l.y = y;
    l.radius = radius;
    l.intensity = 1.0f;
    return l;
}
}

TEST_CASE("ambient darkness fills the raster and is clamped to at least 0.2") {
    LightCompositor compositor(flat_config());
    const ShadowFrame& frame = compositor.compose(dark_snapshot(0.72f), 64, 48);
    CHECK(frame.width() == 64);
    CHECK(frame.height() == 48);
    CHECK(frame.darkness_at(10, 10) == doctest::Approx(0.72f));

    compositor.compose(dark_snapshot(0.05f), 64, 48);
    CHECK(compositor.frame().darkness_at(10, 10) == doctest::Approx(0.2f));
}

TEST_CASE("raster is downscaled from the viewport") {
    LightingConfig config = flat_config();
    config.raster_downscale = 2;
    LightCompositor compositor(config);
    compositor.compose(dark_snapshot(0.5f), 200, 100);
    CHECK(compositor.frame().width() == 100);
    CHECK(compositor.frame().height() == 50);
}

TEST_CASE("lights erase darkness inside their radius only") {
    LightCompositor compositor(flat_config());
    LightingSnapshot snap = dark_snapshot(0.72f);
    snap.lights.push_back(light_at(50.0f, 50.0f, 40.0f));
    compositor.compose(snap, 100, 100);
    const ShadowFrame& frame = compositor.frame();
    CHECK(frame.darkness_at(50, 50) < 0.05f);
    CHECK(frame.darkness_at(70, 50) < 0.72f);
    CHECK(frame.darkness_at(70, 50) > frame.darkness_at(50, 50));
    CHECK(frame.darkness_at(95, 95) == doctest::Approx(0.72f));
}

TEST_CASE("blockers darken the region behind them") {
    LightCompositor compositor(flat_config());
    LightingSnapshot snap = dark_snapshot(0.72f);
    snap.lights.push_back(light_at(20.0f, 50.0f, 80.0f));
    compositor.compose(snap, 100, 100);
    const float open = compositor.frame().darkness_at(60, 50);
    const float front = compositor.frame().darkness_at(30, 50);
    CHECK(compositor.shadows_drawn() == 0);

    Blocker b;
    b.x = 40.0f;
    b.y = 45.0f;
    b.width = 10.0f;
    b.height = 10.0f;
    snap.blockers.push_back(b);
    compositor.compose(snap, 100, 100);
    CHECK(compositor.shadows_drawn() == 1);
    CHECK(compositor.frame().darkness_at(60, 50) > open);
    CHECK(compositor.frame().darkness_at(30, 50) == doctest::Approx(front));
}

TEST_CASE("glow halos are additive and ignore darkness") {
    LightCompositor compositor(flat_config());
    LightingSnapshot snap = dark_snapshot(0.9f);
    snap.glows.push_back(GlowPoint{ 50.0f, 50.0f });
    compositor.compose(snap, 100, 100);
    CHECK(compositor.frame().glow_at(50, 50) > 0.3f);
    CHECK(compositor.frame().glow_at(50, 50) <= 0.35f);
    CHECK(compositor.frame().glow_at(90, 90) == 0.0f);
    CHECK(compositor.frame().darkness_at(50, 50) == doctest::Approx(0.9f));
}

TEST_CASE("present streams the frame to a software renderer") {
    ensure_sdl();
    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, 64, 64, 32, SDL_PIXELFORMAT_RGBA32);
    REQUIRE(surface != nullptr);
    SDL_Renderer* renderer = SDL_CreateSoftwareRenderer(surface);
    REQUIRE(renderer != nullptr);

    {
        LightCompositor compositor(flat_config());
        CHECK_FALSE(compositor.present(renderer));
        compositor.compose(dark_snapshot(0.5f), 64, 64);
        CHECK(compositor.present(renderer));
        CHECK(compositor.enabled());
        CHECK_FALSE(compositor.present(nullptr));
        compositor.release_textures();
    }

    SDL_DestroyRenderer(renderer);
    SDL_FreeSurface(surface);
}

TEST_CASE("scene composes at the throttled rate and stops on shutdown") {
    LightingConfig config = flat_config();
    config.frame_rate = 30;
    LightingScene scene(config, 80, 60, false);
    const auto t0 = LightingScene::clock::now();

    CHECK_FALSE(scene.update(t0));

    auto snap = std::make_shared<LightingSnapshot>(dark_snapshot(0.6f));
    snap->lights.push_back(light_at(40.0f, 30.0f, 20.0f));
    scene.set_snapshot(snap, t0);
    CHECK(scene.update(t0));
    CHECK_FALSE(scene.update(t0 + 10ms));
    CHECK(scene.update(t0 + 40ms));
    CHECK(scene.compositor().frame().darkness_at(40, 30) < 0.05f);

    scene.shutdown();
    CHECK_FALSE(scene.running());
    CHECK_FALSE(scene.update(t0 + 200ms));
    CHECK(scene.snapshot() == nullptr);
}

TEST_CASE("resizing the viewport recomposes at the new size") {
    LightingConfig config = flat_config();
    config.frame_rate = 30;
    LightingScene scene(config, 80, 60, false);
    const auto t0 = LightingScene::clock::now();
    scene.set_snapshot(std::make_shared<LightingSnapshot>(dark_snapshot(0.6f)), t0);
    REQUIRE(scene.update(t0));
    CHECK(scene.compositor().frame().width() == 80);

    scene.set_viewport(160, 120);
    CHECK(scene.update(t0 + 5ms));
    CHECK(scene.compositor().frame().width() == 160);
    CHECK(scene.compositor().frame().height() == 120);

    scene.set_viewport(0, 0);
    CHECK(scene.update(t0 + 80ms));
    CHECK(scene.compositor().frame().width() == 160);
    scene.shutdown();
}

TEST_CASE("view fit centers the world at the largest uniform scale") {
    const ViewTransform wide = ViewTransform::fit(100.0f, 50.0f, 400, 400);
    CHECK(wide.scale == doctest::Approx(4.0f));
    CHECK(wide.offset_x == doctest::Approx(0.0f));
    CHECK(wide.offset_y == doctest::Approx(100.0f));

    const ViewTransform tall = ViewTransform::fit(100.0f, 50.0f, 1000, 200);
    CHECK(tall.scale == doctest::Approx(4.0f));
    CHECK(tall.offset_x == doctest::Approx(300.0f));
    CHECK(tall.offset_y == doctest::Approx(0.0f));

    const ViewTransform collapsed = ViewTransform::fit(100.0f, 50.0f, 0, 0);
    CHECK(collapsed.scale == doctest::Approx(1.0f));
}
