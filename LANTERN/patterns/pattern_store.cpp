#include "pattern_store.hpp"
#include <nlohmann/json.hpp>

using nlohmann::json;

std::vector<Blocker> resolve_effective_pattern(const TileInstance& tile, const PatternStore& store) {
        if (!tile.id.empty()) {
                const auto o_it = store.overrides.find(tile.id);
                if (o_it != store.overrides.end()) {
                        return o_it->second;
                }
        }
        if (!tile.type_id.empty()) {
                const auto d_it = store.defaults.find(tile.type_id);
                if (d_it != store.defaults.end()) {
                        return d_it->second.rects;
                }
        }
        return {};
}

std::vector<Blocker> blockers_from_json_array(const json& data) {
        std::vector<Blocker> out;
        if (!data.is_array()) return out;
        out.reserve(data.size());
        for (const auto& entry : data) {
                if (auto b = blocker_from_json(entry)) {
                        out.push_back(*b);
                }
        }
        return out;
}

json blockers_to_json_array(const std::vector<Blocker>& rects) {
        json arr = json::array();
        for (const auto& r : rects) {
                arr.push_back(blocker_to_json(r));
        }
        return arr;
}

PatternStore pattern_store_from_json(const json& data, bool* legacy) {
        PatternStore store;
        if (legacy) *legacy = false;
        if (!data.is_object()) {
                return store;
        }
        const auto d_it = data.find("defaults");
        const auto o_it = data.find("overrides");
        if (d_it == data.end() && o_it == data.end()) {
                if (legacy) *legacy = true;
                return store;
        }
        if (d_it != data.end() && d_it->is_object()) {
                for (auto it = d_it->begin(); it != d_it->end(); ++it) {
                        const json& record = it.value();
                        if (!record.is_object()) continue;
                        DefaultPattern entry;
                        const auto rects_it = record.find("rects");
                        if (rects_it != record.end()) {
                                entry.rects = blockers_from_json_array(*rects_it);
                        }
                        entry.apply_after = json_number(record, "applyAfter").value_or(0.0);
                        store.defaults[it.key()] = std::move(entry);
                }
        }
        if (o_it != data.end() && o_it->is_object()) {
                for (auto it = o_it->begin(); it != o_it->end(); ++it) {
                        if (!it.value().is_array()) continue;
                        store.overrides[it.key()] = blockers_from_json_array(it.value());
                }
        }
        return store;
}

json pattern_store_to_json(const PatternStore& store) {
        json defaults = json::object();
        for (const auto& [type_id, entry] : store.defaults) {
                defaults[type_id] = {
                        {"rects", blockers_to_json_array(entry.rects)},
                        {"applyAfter", entry.apply_after}
                };
        }
        json overrides = json::object();
        for (const auto& [tile_id, rects] : store.overrides) {
                overrides[tile_id] = blockers_to_json_array(rects);
        }
        return json{
                {"defaults", defaults},
                {"overrides", overrides}
        };
}
