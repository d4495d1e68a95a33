#pragma once

#include <string>
#include <nlohmann/json.hpp>

class JsonFile {
public:
    static bool load(const std::string& path, nlohmann::json& out);
    static bool save(const std::string& path, const nlohmann::json& data, int indent = 2);
};
