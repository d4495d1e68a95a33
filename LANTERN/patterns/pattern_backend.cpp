#include "pattern_backend.hpp"
#include "utils/json_file.hpp"
#include <utility>

JsonFilePatternBackend::JsonFilePatternBackend(std::string path)
: path_(std::move(path)) {}

bool JsonFilePatternBackend::load(nlohmann::json& out) {
    return JsonFile::load(path_, out);
}

bool JsonFilePatternBackend::save(const nlohmann::json& data) {
    return JsonFile::save(path_, data, 2);
}

MemoryPatternBackend::MemoryPatternBackend(nlohmann::json initial)
: data_(std::move(initial)), has_data_(true) {}

bool MemoryPatternBackend::load(nlohmann::json& out) {
    if (!has_data_) return false;
    out = data_;
    return true;
}

bool MemoryPatternBackend::save(const nlohmann::json& data) {
    if (fail_saves_) return false;
    data_ = data;
    has_data_ = true;
    ++save_count_;
    return true;
}
