#include "discovery_grid.hpp"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

namespace {

bool parse_int(const std::string& text, int& out) {
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(text.c_str(), &end, 10);
    if (!end || end == text.c_str() || *end != '\0') return false;
    if (errno == ERANGE || v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

}

DiscoveryGrid::DiscoveryGrid(int cols, int rows, float cell_size)
    : cols_(std::max(0, cols)),
      rows_(std::max(0, rows)),
      cell_size_((std::isfinite(cell_size) && cell_size > 0.0f) ? cell_size : 1.0f)
{
    grid_.resize(static_cast<size_t>(cols_) * static_cast<size_t>(rows_));
}

bool DiscoveryGrid::cell_at(float world_x, float world_y, int& col, int& row) const {
    if (!std::isfinite(world_x) || !std::isfinite(world_y)) return false;
    col = static_cast<int>(std::floor(world_x / cell_size_));
    row = static_cast<int>(std::floor(world_y / cell_size_));
    return in_bounds(col, row);
}

int DiscoveryGrid::apply_visible(const std::vector<std::string>& keys) {
    for (auto& cell : grid_) cell.visible = false;
    if (!persist_) {
        for (auto& cell : grid_) cell.discovered = false;
        discovered_count_ = 0;
    }
    int added = 0;
    for (const auto& key : keys) {
        int col = 0;
        int row = 0;
        if (!parse_key(key, col, row) || !in_bounds(col, row)) continue;
        Cell& cell = grid_[idx(col, row)];
        cell.visible = true;
        if (!cell.discovered) {
            cell.discovered = true;
            ++discovered_count_;
            ++added;
        }
    }
    return added;
}

void DiscoveryGrid::clear_visible() {
    for (auto& cell : grid_) cell.visible = false;
    if (!persist_) {
        for (auto& cell : grid_) cell.discovered = false;
        discovered_count_ = 0;
    }
}

void DiscoveryGrid::reset() {
    for (auto& cell : grid_) cell = Cell{};
    discovered_count_ = 0;
}

bool DiscoveryGrid::is_visible(int col, int row) const {
    return in_bounds(col, row) && grid_[idx(col, row)].visible;
}

bool DiscoveryGrid::is_discovered(int col, int row) const {
    return in_bounds(col, row) && grid_[idx(col, row)].discovered;
}

int DiscoveryGrid::visible_count() const {
    return static_cast<int>(std::count_if(grid_.begin(), grid_.end(), [](const Cell& c) { return c.visible; }));
}

std::vector<std::string> DiscoveryGrid::discovered_keys() const {
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(discovered_count_));
    for (int row = 0; row < rows_; ++row) {
        for (int col = 0; col < cols_; ++col) {
            if (grid_[idx(col, row)].discovered) out.push_back(make_key(col, row));
        }
    }
    return out;
}

std::vector<std::string> DiscoveryGrid::visible_keys() const {
    std::vector<std::string> out;
    for (int row = 0; row < rows_; ++row) {
        for (int col = 0; col < cols_; ++col) {
            if (grid_[idx(col, row)].visible) out.push_back(make_key(col, row));
        }
    }
    return out;
}

std::string DiscoveryGrid::make_key(int col, int row) {
    return std::to_string(col) + "," + std::to_string(row);
}

bool DiscoveryGrid::parse_key(const std::string& key, int& col, int& row) {
    const auto comma = key.find(',');
    if (comma == std::string::npos || comma == 0 || comma + 1 >= key.size()) return false;
    int c = 0;
    int r = 0;
    if (!parse_int(key.substr(0, comma), c) || !parse_int(key.substr(comma + 1), r)) return false;
    col = c;
    row = r;
    return true;
}
