#include "lighting_config.hpp"
#include "utils/json_file.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

float finite_or(float value, float fallback) {
        return std::isfinite(value) ? value : fallback;
}

template <typename T>
T read_value(const json& data, const char* key, T fallback) {
        try {
                return data.value(key, fallback);
        } catch (const json::exception& e) {
                std::cerr << "[LightingConfig] Ignoring '" << key << "': " << e.what() << "\n";
                return fallback;
        }
}

}

const char* occlusion_mode_name(OcclusionMode mode) {
        return mode == OcclusionMode::VisibilityPolygon ? "polygon" : "containment";
}

bool LightingConfig::load(const std::string& path) {
        if (path.empty()) {
                return false;
        }
        json j;
        if (!JsonFile::load(path, j)) {
                std::cerr << "[LightingConfig] Using defaults, could not load " << path << "\n";
                return false;
        }
        apply_config(j);
        return true;
}

void LightingConfig::apply_config(const json& data) {
        if (!data.is_object()) {
                return;
        }

        ambient_darkness = std::clamp(finite_or(read_value(data, "ambient_darkness", ambient_darkness), 0.72f), 0.0f, 1.0f);
        frame_rate       = std::clamp(read_value(data, "frame_rate", frame_rate), 1, 240);
        raster_downscale = std::clamp(read_value(data, "raster_downscale", raster_downscale), 1, 8);
        glow_radius      = std::max(0.0f, finite_or(read_value(data, "glow_radius", glow_radius), 22.0f));
        glow_opacity     = std::clamp(finite_or(read_value(data, "glow_opacity", glow_opacity), 0.35f), 0.0f, 1.0f);
        shadow_jitter    = std::max(0.0f, finite_or(read_value(data, "shadow_jitter", shadow_jitter), 1.5f));
        debugging        = read_value(data, "debugging", debugging);

        const auto fl_it = data.find("global_flicker");
        if (fl_it != data.end() && fl_it->is_object()) {
                global_flicker.enabled = read_value(*fl_it, "enabled", true);
                global_flicker.speed   = finite_or(read_value(*fl_it, "speed", global_flicker.speed), 0.5f);
                global_flicker.amount  = std::clamp(finite_or(read_value(*fl_it, "amount", global_flicker.amount), 0.08f), 0.0f, 1.0f);
        }

        const auto d_it = data.find("discovery");
        if (d_it != data.end() && d_it->is_object()) {
                const json& d = *d_it;
                discovery.debounce_ms         = std::max(0, read_value(d, "debounce_ms", discovery.debounce_ms));
                discovery.intensity_threshold = std::clamp(finite_or(read_value(d, "intensity_threshold", discovery.intensity_threshold), 0.12f), 0.0f, 1.0f);
                discovery.persist             = read_value(d, "persist", discovery.persist);
                discovery.ambient             = std::clamp(finite_or(read_value(d, "ambient", discovery.ambient), 0.0f), 0.0f, 1.0f);
                discovery.blocker_opacity     = std::clamp(finite_or(read_value(d, "blocker_opacity", discovery.blocker_opacity), 1.0f), 0.0f, 1.0f);
                const std::string mode = read_value(d, "occlusion", std::string(occlusion_mode_name(discovery.occlusion)));
                if (mode == "polygon") {
                        discovery.occlusion = OcclusionMode::VisibilityPolygon;
                } else if (mode == "containment") {
                        discovery.occlusion = OcclusionMode::Containment;
                } else {
                        std::cerr << "[LightingConfig] Unknown occlusion mode '" << mode << "', keeping "
                                  << occlusion_mode_name(discovery.occlusion) << "\n";
                }
        }

        const auto p_it = data.find("patterns");
        if (p_it != data.end() && p_it->is_object()) {
                patterns.path             = read_value(*p_it, "path", patterns.path);
                patterns.save_debounce_ms = std::max(0, read_value(*p_it, "save_debounce_ms", patterns.save_debounce_ms));
        }

        const auto g_it = data.find("grid");
        if (g_it != data.end() && g_it->is_object()) {
                grid.cols      = std::max(1, read_value(*g_it, "cols", grid.cols));
                grid.rows      = std::max(1, read_value(*g_it, "rows", grid.rows));
                grid.cell_size = finite_or(read_value(*g_it, "cell_size", grid.cell_size), 100.0f);
                if (grid.cell_size <= 0.0f) grid.cell_size = 100.0f;
        }
}

json LightingConfig::to_json() const {
        json j;
        j["ambient_darkness"] = ambient_darkness;
        j["frame_rate"]       = frame_rate;
        j["raster_downscale"] = raster_downscale;
        j["glow_radius"]      = glow_radius;
        j["glow_opacity"]     = glow_opacity;
        j["shadow_jitter"]    = shadow_jitter;
        j["debugging"]        = debugging;
        j["global_flicker"]   = {
                {"enabled", global_flicker.enabled},
                {"speed", global_flicker.speed},
                {"amount", global_flicker.amount}
        };
        j["discovery"] = {
                {"debounce_ms", discovery.debounce_ms},
                {"intensity_threshold", discovery.intensity_threshold},
                {"persist", discovery.persist},
                {"ambient", discovery.ambient},
                {"blocker_opacity", discovery.blocker_opacity},
                {"occlusion", occlusion_mode_name(discovery.occlusion)}
        };
        j["patterns"] = {
                {"path", patterns.path},
                {"save_debounce_ms", patterns.save_debounce_ms}
        };
        j["grid"] = {
                {"cols", grid.cols},
                {"rows", grid.rows},
                {"cell_size", grid.cell_size}
        };
        return j;
}
