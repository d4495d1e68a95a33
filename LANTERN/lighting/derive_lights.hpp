#pragma once

#include <optional>
#include <string>
#include <vector>
#include <SDL.h>
#include "patterns/pattern_store.hpp"
#include "utils/blocker.hpp"
#include "utils/light_source.hpp"

/*
  projection from game state to the lights, glows and blockers of one evaluation
  nothing here is persisted; call again whenever the game state changes
*/

struct SaplingState {
    int col = 0;
    int row = 0;
    int growth = 0;
};

// Either a grid position, or a tile id whose position the actor inherits.
struct ActorPlacement {
    std::string id;
    int  level = 1;
    bool on_grid = true;
    int  col = 0;
    int  row = 0;
    std::string tile_id;
};

struct DragPreview {
    float x = 0.0f;
    float y = 0.0f;
    SDL_Color color{127, 219, 202, 255};
};

struct GameStateView {
    std::optional<SaplingState> sapling;
    std::vector<ActorPlacement> actors;
    std::optional<DragPreview> drag_preview;
    std::vector<TileInstance> tiles;
    float cell_size = 100.0f;
};

struct LightFrame {
    std::vector<LightSource> lights;
    std::vector<GlowPoint> glows;
    std::vector<Blocker> discovery_blockers;
};

constexpr float kSaplingBaseRadius    = 350.0f;
constexpr float kSaplingRadiusStep    = 20.0f;
constexpr float kSaplingBaseIntensity = 0.85f;
constexpr float kSaplingIntensityStep = 0.02f;
constexpr float kActorBaseRadius      = kSaplingBaseRadius * 0.2f;
constexpr float kActorRadiusStep      = kSaplingRadiusStep * 0.2f;

SDL_Color sapling_light_color(int growth_level);
SDL_Color parse_hex_color(const std::string& hex, SDL_Color fallback = SDL_Color{255, 255, 255, 255});

LightSource sapling_light(const SaplingState& sapling, float cell_size);
LightSource actor_light(const ActorPlacement& actor, float x, float y);
LightSource drag_preview_light(const DragPreview& preview, float cell_size);

LightFrame derive_lights(const GameStateView& state);
