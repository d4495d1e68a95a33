#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "utils/blocker.hpp"

/*
  light blocker patterns keyed by tile type (defaults) and tile instance (overrides)
  rects are tile local, origin at the tile's top left corner
*/

struct DefaultPattern {
    std::vector<Blocker> rects;
    double apply_after = 0.0;
};

inline bool operator==(const DefaultPattern& a, const DefaultPattern& b) {
    return a.rects == b.rects && a.apply_after == b.apply_after;
}

struct PatternStore {
    std::map<std::string, DefaultPattern> defaults;
    std::map<std::string, std::vector<Blocker>> overrides;

    bool empty() const { return defaults.empty() && overrides.empty(); }
};

inline bool operator==(const PatternStore& a, const PatternStore& b) {
    return a.defaults == b.defaults && a.overrides == b.overrides;
}

struct TileInstance {
    std::string id;
    std::string type_id;
    int  col = 0;
    int  row = 0;
    bool placed = true;
    bool blocks_light = false;
};

// Override wins outright, else the type default, else empty. Never merges.
std::vector<Blocker> resolve_effective_pattern(const TileInstance& tile, const PatternStore& store);

// Normalizes a serialized store. Malformed entries are dropped, castHeight and
// softness are clamped. legacy is set when the document carries neither
// "defaults" nor "overrides".
PatternStore pattern_store_from_json(const nlohmann::json& data, bool* legacy = nullptr);
nlohmann::json pattern_store_to_json(const PatternStore& store);

std::vector<Blocker> blockers_from_json_array(const nlohmann::json& data);
nlohmann::json blockers_to_json_array(const std::vector<Blocker>& rects);
