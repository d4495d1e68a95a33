#pragma once

#include <optional>
#include <vector>
#include <nlohmann/json_fwd.hpp>

/*
  axis aligned light blocker
  cast_height drives shadow length, softness drives shadow alpha
*/

constexpr int kDefaultCastHeight = 9;
constexpr int kDefaultSoftness   = 5;

struct Blocker {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    int   cast_height = kDefaultCastHeight;
    int   softness = kDefaultSoftness;

    bool contains(float px, float py) const {
        return px >= x && px <= x + width && py >= y && py <= y + height;
    }
    float center_x() const { return x + width * 0.5f; }
    float center_y() const { return y + height * 0.5f; }
};

inline bool operator==(const Blocker& a, const Blocker& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height &&
           a.cast_height == b.cast_height && a.softness == b.softness;
}

inline bool operator!=(const Blocker& a, const Blocker& b) { return !(a == b); }

int clamp_1_to_9(double value, int fallback);
int clamp_1_to_9(const std::optional<double>& value, int fallback);

// Reads a numeric field, returning nullopt for missing or non-numeric values.
std::optional<double> json_number(const nlohmann::json& data, const char* key);

bool is_valid_blocker(const Blocker& b);

// Clamps authoring parameters; returns nullopt when the rectangle is malformed.
std::optional<Blocker> sanitize_blocker(const Blocker& b);

std::vector<Blocker> sanitize_blockers(const std::vector<Blocker>& blockers);

std::optional<Blocker> blocker_from_json(const nlohmann::json& data);
nlohmann::json blocker_to_json(const Blocker& b);
