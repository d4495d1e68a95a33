#include "main.hpp"
#include "patterns/pattern_backend.hpp"
#include "patterns/pattern_repository.hpp"
#include "procgen/blocker_generator.hpp"
#include "render/lighting_scene.hpp"
#include "utils/seeded_random.hpp"
#include <SDL.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr const char* kGroveType = "grove";
constexpr const char* kStoneType = "stone";

}

DemoApp::DemoApp(const std::string& config_path, SDL_Renderer* renderer, int screen_w, int screen_h)
: config_path_(config_path), renderer_(renderer), screen_w_(screen_w), screen_h_(screen_h) {}

DemoApp::~DemoApp() {
	if (scene_) scene_->shutdown();
	if (patterns_) patterns_->flush();
}

void DemoApp::init() {
	setup();
	game_loop();
}

void DemoApp::setup() {
        if (!config_.load(config_path_)) {
                std::cout << "[Demo] Running with default lighting settings\n";
        }
        const GridSettings& grid = config_.grid;
        state_.cell_size = grid.cell_size;

        patterns_ = std::make_unique<PatternRepository>(
                std::make_unique<JsonFilePatternBackend>(config_.patterns.path),
                std::chrono::milliseconds(config_.patterns.save_debounce_ms));
        if (!patterns_->load()) {
                std::cout << "[Demo] No saved patterns in " << config_.patterns.path << "\n";
        }
        if (!patterns_->find_default(kGroveType)) {
                const int mid_col = grid.cols / 2;
                const int mid_row = grid.rows / 2;
                patterns_->set_default(kGroveType, generate_cell_blockers(mid_col, mid_row, grid.cell_size), 0.0);
        }

        SeededRandom rng(SeededRandom::hash_seed("lantern-demo"));
        for (int row = 0; row < grid.rows; ++row) {
                for (int col = 0; col < grid.cols; ++col) {
                        const int roll = rng.next_int(10);
                        if (roll > 2) continue;
                        TileInstance tile;
                        tile.id = "tile-" + std::to_string(col) + "-" + std::to_string(row);
                        tile.type_id = roll == 0 ? kStoneType : kGroveType;
                        tile.col = col;
                        tile.row = row;
                        tile.blocks_light = (roll == 0);
                        state_.tiles.push_back(tile);
                }
        }

        state_.sapling = SaplingState{ grid.cols / 2, grid.rows / 2, 1 };
        for (int i = 0; i < 3; ++i) {
                ActorPlacement actor;
                actor.id = "actor-" + std::to_string(i);
                actor.level = 1 + i * 2;
                actor.col = rng.rand_range(0, grid.cols - 1);
                actor.row = rng.rand_range(0, grid.rows - 1);
                state_.actors.push_back(actor);
        }

        fit_view();
        scene_ = std::make_unique<LightingScene>(config_, screen_w_, screen_h_);
        started_ = std::chrono::steady_clock::now();
        std::cout << "[Demo] " << state_.tiles.size() << " tiles, patterns from "
                  << config_.patterns.path << "\n";
}

void DemoApp::fit_view() {
        const GridSettings& grid = config_.grid;
        view_ = ViewTransform::fit(grid.cols * grid.cell_size, grid.rows * grid.cell_size, screen_w_, screen_h_);
}

SDL_FPoint DemoApp::screen_to_world(int x, int y) const {
        const float s = view_.scale > 0.0f ? view_.scale : 1.0f;
        return SDL_FPoint{ (x - view_.offset_x) / s, (y - view_.offset_y) / s };
}

TileInstance* DemoApp::tile_under_mouse() {
        const SDL_FPoint w = screen_to_world(mouse_x_, mouse_y_);
        const int col = static_cast<int>(std::floor(w.x / state_.cell_size));
        const int row = static_cast<int>(std::floor(w.y / state_.cell_size));
        for (auto& tile : state_.tiles) {
                if (tile.col == col && tile.row == row) return &tile;
        }
        return nullptr;
}

void DemoApp::handle_event(const SDL_Event& e) {
        if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                int w = 0, h = 0;
                if (SDL_GetRendererOutputSize(renderer_, &w, &h) != 0 || w <= 0 || h <= 0) return;
                screen_w_ = w;
                screen_h_ = h;
                fit_view();
                scene_->set_viewport(screen_w_, screen_h_);
                std::cout << "[Demo] Resized to " << screen_w_ << "x" << screen_h_ << "\n";
        } else if (e.type == SDL_MOUSEMOTION) {
                mouse_x_ = e.motion.x;
                mouse_y_ = e.motion.y;
        } else if (e.type == SDL_MOUSEBUTTONDOWN && e.button.button == SDL_BUTTON_LEFT) {
                dragging_ = true;
        } else if (e.type == SDL_MOUSEBUTTONUP && e.button.button == SDL_BUTTON_LEFT) {
                dragging_ = false;
        } else if (e.type == SDL_KEYDOWN) {
                TileInstance* tile = tile_under_mouse();
                const double now_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
                switch (e.key.keysym.sym) {
                case SDLK_d:
                        discovery_on_ = !discovery_on_;
                        scene_->set_discovery_active(discovery_on_);
                        break;
                case SDLK_z:
                        if (!patterns_->undo()) std::cout << "[Demo] Nothing to undo\n";
                        break;
                case SDLK_y:
                        if (!patterns_->redo()) std::cout << "[Demo] Nothing to redo\n";
                        break;
                case SDLK_t:
                case SDLK_q:
                        if (tile) {
                                const SDL_FPoint w = screen_to_world(mouse_x_, mouse_y_);
                                const float local_x = w.x - tile->col * state_.cell_size;
                                const float local_y = w.y - tile->row * state_.cell_size;
                                const StampType type = e.key.keysym.sym == SDLK_t ? StampType::Tree : StampType::Square;
                                patterns_->add_rects(*tile, create_stamp_rects(type, local_x, local_y,
                                                                               state_.cell_size * 0.25f, 8, 5));
                        }
                        break;
                case SDLK_c:
                        if (tile && !patterns_->clear_tile(*tile, now_s)) {
                                std::cout << "[Demo] Tile has no id to clear\n";
                        }
                        break;
                case SDLK_BACKSPACE:
                        if (tile && !patterns_->remove_rects(*tile, {})) {
                                std::cout << "[Demo] " << tile->id << " has no rects to remove\n";
                        }
                        break;
                case SDLK_p:
                        if (tile && !patterns_->promote_override(*tile, now_s)) {
                                std::cout << "[Demo] " << tile->id << " has no override to promote\n";
                        }
                        break;
                case SDLK_g:
                        if (state_.sapling) state_.sapling->growth = (state_.sapling->growth + 1) % 6;
                        break;
                default:
                        break;
                }
        }
}

void DemoApp::step_actors(float elapsed) {
        const GridSettings& grid = config_.grid;
        const int tick = static_cast<int>(elapsed * 0.5f);
        for (size_t i = 0; i < state_.actors.size(); ++i) {
                SeededRandom rng(SeededRandom::seed_from_grid(tick, static_cast<int>(i)));
                auto& actor = state_.actors[i];
                actor.col = std::clamp(actor.col + rng.rand_range(-1, 1), 0, grid.cols - 1);
                actor.row = std::clamp(actor.row + rng.rand_range(-1, 1), 0, grid.rows - 1);
        }
}

void DemoApp::refresh_snapshot(float elapsed) {
        if (dragging_) {
                const SDL_FPoint w = screen_to_world(mouse_x_, mouse_y_);
                state_.drag_preview = DragPreview{ w.x, w.y, sapling_light_color(0) };
        } else {
                state_.drag_preview.reset();
        }

        LightFrame frame = derive_lights(state_);
        auto snapshot = std::make_shared<LightingSnapshot>();
        snapshot->lights = std::move(frame.lights);
        snapshot->glows = std::move(frame.glows);
        snapshot->discovery_blockers = std::move(frame.discovery_blockers);
        snapshot->blockers = patterns_->collect_world_blockers(state_.tiles, state_.cell_size);
        snapshot->ambient_darkness = config_.ambient_darkness;
        snapshot->global_flicker = config_.global_flicker;
        snapshot->elapsed = elapsed;
        snapshot->tile_size = state_.cell_size;
        snapshot->view = view_;
        scene_->set_snapshot(std::move(snapshot));
}

void DemoApp::draw_grid() {
        const GridSettings& grid = config_.grid;
        const DiscoveryGrid& fog = scene_->discovery().grid();
        const int cell_px = std::max(1, static_cast<int>(grid.cell_size * view_.scale));
        for (int row = 0; row < grid.rows; ++row) {
                for (int col = 0; col < grid.cols; ++col) {
                        const SDL_FPoint p = view_.world_to_screen(col * grid.cell_size, row * grid.cell_size);
                        SDL_Rect r{ static_cast<int>(p.x), static_cast<int>(p.y), cell_px, cell_px };
                        if (!fog.is_discovered(col, row)) {
                                SDL_SetRenderDrawColor(renderer_, 8, 10, 14, 255);
                        } else if (fog.is_visible(col, row)) {
                                SDL_SetRenderDrawColor(renderer_, 52, 78, 60, 255);
                        } else {
                                SDL_SetRenderDrawColor(renderer_, 30, 40, 36, 255);
                        }
                        SDL_RenderFillRect(renderer_, &r);
                        SDL_SetRenderDrawColor(renderer_, 69, 101, 74, 255);
                        SDL_RenderDrawRect(renderer_, &r);
                }
        }
        SDL_SetRenderDrawColor(renderer_, 120, 96, 64, 255);
        for (const auto& tile : state_.tiles) {
                for (const auto& b : patterns_->resolve_effective_pattern(tile)) {
                        const SDL_FPoint p = view_.world_to_screen(tile.col * grid.cell_size + b.x,
                                                                   tile.row * grid.cell_size + b.y);
                        SDL_Rect r{ static_cast<int>(p.x), static_cast<int>(p.y),
                                    std::max(1, static_cast<int>(b.width * view_.scale)),
                                    std::max(1, static_cast<int>(b.height * view_.scale)) };
                        SDL_RenderFillRect(renderer_, &r);
                }
        }
}

void DemoApp::game_loop() {
        constexpr int FRAME_MS = 1000 / 60;
        bool quit = false;
        SDL_Event e;
	while (!quit) {
		Uint32 start = SDL_GetTicks();
		while (SDL_PollEvent(&e)) {
			if (e.type == SDL_QUIT) quit = true;
			if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_ESCAPE) quit = true;
			handle_event(e);
		}
                const auto now = std::chrono::steady_clock::now();
                const float elapsed = std::chrono::duration<float>(now - started_).count();
                step_actors(elapsed);
                refresh_snapshot(elapsed);
                scene_->update(now);
                patterns_->update(now);

                SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
                SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
                SDL_RenderClear(renderer_);
                draw_grid();
                scene_->render(renderer_);
                SDL_RenderPresent(renderer_);

		Uint32 frame_elapsed = SDL_GetTicks() - start;
        if (frame_elapsed < FRAME_MS) SDL_Delay(FRAME_MS - frame_elapsed);
        }
        scene_->shutdown();
        patterns_->flush();
}

void run(SDL_Renderer* renderer, int screen_w, int screen_h, const std::string& config_path) {
        DemoApp app(config_path, renderer, screen_w, screen_h);
        try {
                app.init();
        } catch (const std::exception& e) {
                std::cerr << "[Demo] " << e.what() << "\n";
        }
}

int main(int argc, char* argv[]) {
	std::cout << "[Demo] Starting lantern demo...\n";
	const std::string config_path = (argc > 1 && argv[1]) ? argv[1] : "data/lighting.json";
        if (SDL_Init(SDL_INIT_VIDEO) < 0) {
                std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n"; return 1;
        }
        SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "1");
	SDL_Window* window = SDL_CreateWindow("Lantern", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1200, 1000, SDL_WINDOW_RESIZABLE);
	if (!window) {
		std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
		SDL_Quit(); return 1;
	}
	SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
	if (!renderer) {
		renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
	}
	if (!renderer) {
		std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
		SDL_DestroyWindow(window); SDL_Quit(); return 1;
	}
	SDL_RendererInfo info; SDL_GetRendererInfo(renderer, &info);
	std::cout << "[Demo] Renderer: " << (info.name ? info.name : "Unknown") << "\n";
	int screen_width = 0, screen_height = 0;
	SDL_GetRendererOutputSize(renderer, &screen_width, &screen_height);
	run(renderer, screen_width, screen_height, config_path);
	SDL_DestroyRenderer(renderer);
	SDL_DestroyWindow(window);
	SDL_Quit();
	std::cout << "[Demo] Exited cleanly.\n";
	return 0;
}
