#include "json_file.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

static bool ensure_dirs_for(const std::string& path) {
    fs::path p(path);
    if (!p.has_parent_path()) return true;
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
        std::cerr << "[JsonFile] Failed to create " << p.parent_path().string() << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

bool JsonFile::load(const std::string& path, nlohmann::json& out) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) return false;
    std::ifstream in(path);
    if (!in) {
        std::cerr << "[JsonFile] Failed to open " << path << "\n";
        return false;
    }
    try {
        in >> out;
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[JsonFile] Failed to parse " << path << ": " << e.what() << "\n";
        return false;
    }
}

// Writes to a sibling temp file first so a failed write never truncates the original.
bool JsonFile::save(const std::string& path, const nlohmann::json& data, int indent) {
    if (path.empty()) return false;
    std::string text;
    try {
        text = data.dump(indent);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[JsonFile] Failed to serialize " << path << ": " << e.what() << "\n";
        return false;
    }
    if (!ensure_dirs_for(path)) return false;
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            std::cerr << "[JsonFile] Failed to open " << tmp << " for writing\n";
            return false;
        }
        out << text;
        if (!out) {
            std::cerr << "[JsonFile] Failed to write " << tmp << "\n";
            return false;
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::cerr << "[JsonFile] Failed to replace " << path << ": " << ec.message() << "\n";
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}
