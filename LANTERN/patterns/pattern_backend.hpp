#pragma once

#include <string>
#include <nlohmann/json.hpp>

class PatternBackend {
public:
    virtual ~PatternBackend() = default;
    virtual bool load(nlohmann::json& out) = 0;
    virtual bool save(const nlohmann::json& data) = 0;
    virtual std::string describe() const = 0;
};

class JsonFilePatternBackend : public PatternBackend {
public:
    explicit JsonFilePatternBackend(std::string path);
    bool load(nlohmann::json& out) override;
    bool save(const nlohmann::json& data) override;
    std::string describe() const override { return path_; }

private:
    std::string path_;
};

class MemoryPatternBackend : public PatternBackend {
public:
    MemoryPatternBackend() = default;
    explicit MemoryPatternBackend(nlohmann::json initial);

    bool load(nlohmann::json& out) override;
    bool save(const nlohmann::json& data) override;
    std::string describe() const override { return "memory"; }

    void set_fail_saves(bool fail) { fail_saves_ = fail; }
    int save_count() const { return save_count_; }
    const nlohmann::json& data() const { return data_; }

private:
    nlohmann::json data_;
    bool has_data_ = false;
    bool fail_saves_ = false;
    int save_count_ = 0;
};
