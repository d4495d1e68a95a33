#include "blocker.hpp"
#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

int clamp_1_to_9(double value, int fallback) {
    if (!std::isfinite(value)) return fallback;
    const double rounded = std::round(value);
    if (rounded < 1.0) return fallback;
    if (rounded > 9.0) return 9;
    return static_cast<int>(rounded);
}

int clamp_1_to_9(const std::optional<double>& value, int fallback) {
    if (!value.has_value()) return fallback;
    return clamp_1_to_9(*value, fallback);
}

std::optional<double> json_number(const json& data, const char* key) {
    if (!data.is_object()) return std::nullopt;
    const auto it = data.find(key);
    if (it == data.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

bool is_valid_blocker(const Blocker& b) {
    return std::isfinite(b.x) && std::isfinite(b.y) &&
           std::isfinite(b.width) && std::isfinite(b.height) &&
           b.width >= 0.0f && b.height >= 0.0f;
}

std::optional<Blocker> sanitize_blocker(const Blocker& b) {
    if (!is_valid_blocker(b)) return std::nullopt;
    Blocker out = b;
    out.cast_height = clamp_1_to_9(static_cast<double>(b.cast_height), kDefaultCastHeight);
    out.softness    = clamp_1_to_9(static_cast<double>(b.softness), kDefaultSoftness);
    return out;
}

std::vector<Blocker> sanitize_blockers(const std::vector<Blocker>& blockers) {
    std::vector<Blocker> out;
    out.reserve(blockers.size());
    for (const auto& b : blockers) {
        if (auto clean = sanitize_blocker(b)) out.push_back(*clean);
    }
    return out;
}

std::optional<Blocker> blocker_from_json(const json& data) {
    if (!data.is_object()) return std::nullopt;
    const auto x = json_number(data, "x");
    const auto y = json_number(data, "y");
    const auto w = json_number(data, "width");
    const auto h = json_number(data, "height");
    if (!x || !y || !w || !h) return std::nullopt;
    Blocker b;
    b.x = static_cast<float>(*x);
    b.y = static_cast<float>(*y);
    b.width = static_cast<float>(*w);
    b.height = static_cast<float>(*h);
    b.cast_height = clamp_1_to_9(json_number(data, "castHeight"), kDefaultCastHeight);
    b.softness    = clamp_1_to_9(json_number(data, "softness"), kDefaultSoftness);
    if (!is_valid_blocker(b)) return std::nullopt;
    return b;
}

json blocker_to_json(const Blocker& b) {
    return json{
        {"x", b.x},
        {"y", b.y},
        {"width", b.width},
        {"height", b.height},
        {"castHeight", b.cast_height},
        {"softness", b.softness}
    };
}
