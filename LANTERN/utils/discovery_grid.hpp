#pragma once

#include <string>
#include <vector>
#include <SDL.h>

/*
  rows x cols fog of war grid
  visible is replaced per response, discovered only grows while persist is on
*/

class DiscoveryGrid {
public:
    struct Cell {
        bool visible{false};
        bool discovered{false};
    };

public:
    DiscoveryGrid(int cols, int rows, float cell_size);

    int cols() const { return cols_; }
    int rows() const { return rows_; }
    float cell_size() const { return cell_size_; }
    float world_width() const { return cols_ * cell_size_; }
    float world_height() const { return rows_ * cell_size_; }

    bool in_bounds(int col, int row) const {
        return col >= 0 && col < cols_ && row >= 0 && row < rows_;
    }

    SDL_FPoint cell_center(int col, int row) const {
        return SDL_FPoint{ col * cell_size_ + cell_size_ * 0.5f, row * cell_size_ + cell_size_ * 0.5f };
    }

    bool cell_at(float world_x, float world_y, int& col, int& row) const;

    void set_persist(bool persist) { persist_ = persist; }
    bool persist() const { return persist_; }

    // Replaces the visible set with keys and folds them into discovered.
    // Returns the number of newly discovered cells.
    int apply_visible(const std::vector<std::string>& keys);

    void clear_visible();
    void reset();

    bool is_visible(int col, int row) const;
    bool is_discovered(int col, int row) const;

    int visible_count() const;
    int discovered_count() const { return discovered_count_; }

    std::vector<std::string> discovered_keys() const;
    std::vector<std::string> visible_keys() const;

    static std::string make_key(int col, int row);
    static bool parse_key(const std::string& key, int& col, int& row);

private:
    int cols_ = 0;
    int rows_ = 0;
    float cell_size_ = 1.0f;
    bool persist_ = true;
    int discovered_count_ = 0;
    std::vector<Cell> grid_;

    inline int idx(int col, int row) const { return row * cols_ + col; }
};
