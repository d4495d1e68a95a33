#pragma once

#include <string>
#include <nlohmann/json_fwd.hpp>
#include "utils/light_source.hpp"

enum class OcclusionMode {
    Containment,
    VisibilityPolygon
};

struct DiscoverySettings {
    int   debounce_ms = 80;
    float intensity_threshold = 0.12f;
    bool  persist = true;
    float ambient = 0.0f;
    float blocker_opacity = 1.0f;
    OcclusionMode occlusion = OcclusionMode::Containment;
};

struct PatternSettings {
    std::string path = "data/light_patterns.json";
    int save_debounce_ms = 250;
};

struct GridSettings {
    int   cols = 12;
    int   rows = 10;
    float cell_size = 100.0f;
};

class LightingConfig {
public:
    float ambient_darkness = 0.72f;
    int   frame_rate = 30;
    int   raster_downscale = 2;
    float glow_radius = 22.0f;
    float glow_opacity = 0.35f;
    float shadow_jitter = 1.5f;
    Flicker global_flicker{true, 0.5f, 0.08f};
    DiscoverySettings discovery;
    PatternSettings patterns;
    GridSettings grid;
    bool debugging = false;

    // Missing or unreadable files leave the defaults in place.
    bool load(const std::string& path);
    void apply_config(const nlohmann::json& data);
    nlohmann::json to_json() const;
};

const char* occlusion_mode_name(OcclusionMode mode);
