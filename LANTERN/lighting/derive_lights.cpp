#include "derive_lights.hpp"
#include <algorithm>
#include <array>
#include <cstdlib>
#include <unordered_map>
#include <unordered_set>

namespace {

constexpr std::array<const char*, 6> kGrowthPalette = {
        "#7fdbca", "#90EE90", "#98FB98", "#ADFF2F", "#FFD700", "#FFA500"
};

SDL_FPoint cell_center(int col, int row, float cell_size) {
        return SDL_FPoint{ col * cell_size + cell_size * 0.5f, row * cell_size + cell_size * 0.5f };
}

}

SDL_Color parse_hex_color(const std::string& hex, SDL_Color fallback) {
        std::string s = hex;
        if (!s.empty() && s[0] == '#') s.erase(0, 1);
        if (s.size() != 6) return fallback;
        char* end = nullptr;
        const unsigned long v = std::strtoul(s.c_str(), &end, 16);
        if (!end || *end != '\0') return fallback;
        return SDL_Color{ static_cast<Uint8>((v >> 16) & 0xFF),
                          static_cast<Uint8>((v >> 8) & 0xFF),
                          static_cast<Uint8>(v & 0xFF),
                          255 };
}

SDL_Color sapling_light_color(int growth_level) {
        const int idx = std::clamp(growth_level, 0, static_cast<int>(kGrowthPalette.size()) - 1);
        return parse_hex_color(kGrowthPalette[static_cast<size_t>(idx)]);
}

LightSource sapling_light(const SaplingState& sapling, float cell_size) {
        const int growth = std::max(0, sapling.growth);
        const SDL_FPoint c = cell_center(sapling.col, sapling.row, cell_size);
        LightSource light;
        light.id = "sapling";
        light.x = c.x;
        light.y = c.y;
        light.radius = kSaplingBaseRadius + growth * kSaplingRadiusStep;
        light.intensity = std::min(1.0f, kSaplingBaseIntensity + growth * kSaplingIntensityStep);
        light.color = sapling_light_color(growth);
        light.has_flicker = true;
        light.flicker = Flicker{ true, 0.5f, 0.08f };
        return light;
}

LightSource actor_light(const ActorPlacement& actor, float x, float y) {
        const int level = std::max(1, actor.level);
        LightSource light;
        light.id = actor.id;
        light.x = x;
        light.y = y;
        light.radius = kActorBaseRadius + (level - 1) * kActorRadiusStep;
        light.intensity = std::min(1.0f, kSaplingBaseIntensity + (level - 1) * kSaplingIntensityStep);
        light.color = sapling_light_color(level - 1);
        return light;
}

LightSource drag_preview_light(const DragPreview& preview, float cell_size) {
        LightSource light;
        light.id = "drag_preview";
        light.x = preview.x;
        light.y = preview.y;
        light.radius = cell_size * 0.9f;
        light.intensity = 0.9f;
        light.color = preview.color;
        return light;
}

LightFrame derive_lights(const GameStateView& state) {
        LightFrame frame;
        const float cell = state.cell_size > 0.0f ? state.cell_size : 100.0f;

        if (state.sapling) {
                frame.lights.push_back(sapling_light(*state.sapling, cell));
        }

        std::unordered_map<std::string, const TileInstance*> tiles_by_id;
        for (const auto& tile : state.tiles) {
                if (tile.placed) tiles_by_id[tile.id] = &tile;
        }

        // grid actors first, then actors riding on tiles; first placement wins
        std::unordered_set<std::string> seen;
        for (int pass = 0; pass < 2; ++pass) {
                for (const auto& actor : state.actors) {
                        const bool wants_grid = (pass == 0);
                        if (actor.on_grid != wants_grid) continue;
                        int col = actor.col;
                        int row = actor.row;
                        if (!actor.on_grid) {
                                auto it = tiles_by_id.find(actor.tile_id);
                                if (it == tiles_by_id.end()) continue;
                                col = it->second->col;
                                row = it->second->row;
                        }
                        if (!seen.insert(actor.id).second) continue;
                        const SDL_FPoint c = cell_center(col, row, cell);
                        frame.lights.push_back(actor_light(actor, c.x, c.y));
                        if (actor.on_grid) {
                                frame.glows.push_back(GlowPoint{ c.x, c.y });
                        }
                }
        }

        if (state.drag_preview) {
                frame.lights.push_back(drag_preview_light(*state.drag_preview, cell));
        }

        for (const auto& tile : state.tiles) {
                if (!tile.placed || !tile.blocks_light) continue;
                Blocker b;
                b.x = tile.col * cell;
                b.y = tile.row * cell;
                b.width = cell;
                b.height = cell;
                frame.discovery_blockers.push_back(b);
        }

        frame.lights = sanitize_lights(frame.lights);
        return frame;
}
