#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/lighting_config.hpp"
#include "utils/blocker.hpp"
#include "utils/light_source.hpp"

struct DiscoveryLight {
    float x = 0.0f;
    float y = 0.0f;
    float radius = 0.0f;
    float intensity = 0.0f;
};

// Immutable once posted; the worker owns its copy.
struct DiscoveryRequest {
    std::vector<DiscoveryLight> lights;
    std::vector<Blocker> blockers;
    int   rows = 0;
    int   cols = 0;
    float cell_size = 0.0f;
    float world_width = 0.0f;
    float world_height = 0.0f;
    float intensity_threshold = 0.12f;
    float ambient = 0.0f;
    float blocker_opacity = 1.0f;
    OcclusionMode occlusion = OcclusionMode::Containment;
    uint64_t sequence = 0;
};

struct DiscoveryResponse {
    std::vector<std::string> visible;
    uint64_t sequence = 0;
};

inline DiscoveryLight to_discovery_light(const LightSource& light) {
    return DiscoveryLight{ light.x, light.y, light.radius, light.intensity };
}
