#pragma once

#include <SDL.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "core/lighting_config.hpp"
#include "lighting/derive_lights.hpp"
#include "lighting/lighting_snapshot.hpp"

class LightingScene;
class PatternRepository;

class DemoApp {

	public:
    DemoApp(const std::string& config_path, SDL_Renderer* renderer, int screen_w, int screen_h);
    virtual ~DemoApp();
    virtual void init();
    virtual void game_loop();
    virtual void setup();

	protected:
    void handle_event(const SDL_Event& e);
    void fit_view();
    void step_actors(float elapsed);
    void refresh_snapshot(float elapsed);
    void draw_grid();
    TileInstance* tile_under_mouse();
    SDL_FPoint screen_to_world(int x, int y) const;

	protected:
    std::string   config_path_;
    SDL_Renderer* renderer_   = nullptr;
    int           screen_w_   = 0;
    int           screen_h_   = 0;
    LightingConfig config_;
    std::unique_ptr<PatternRepository> patterns_;
    std::unique_ptr<LightingScene> scene_;
    GameStateView state_;
    ViewTransform view_;
    int mouse_x_ = 0;
    int mouse_y_ = 0;
    bool dragging_ = false;
    bool discovery_on_ = true;
    std::chrono::steady_clock::time_point started_;
};

void run(SDL_Renderer* renderer, int screen_w, int screen_h, const std::string& config_path);
