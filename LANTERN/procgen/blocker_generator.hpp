#pragma once

#include <cstdint>
#include <vector>
#include "utils/blocker.hpp"

/*
  seeded decorative blocker placement inside one cell, plus authoring stamps
  output rects are cell local
*/

enum class StampType {
    Tree,
    Square
};

struct BlockerGenOptions {
    float cell_size  = 100.0f;
    int   min_count  = 5;
    int   max_count  = 7;
    int   min_width  = 8;
    int   max_width  = 18;
    int   min_height = 14;
    int   max_height = 36;
    float inset      = 6.0f;
    int   min_cast_height = 4;
    int   max_cast_height = 9;
    int   min_softness = 3;
    int   max_softness = 8;
};

// Pure function of seed and options.
std::vector<Blocker> generate_blockers(uint32_t seed, const BlockerGenOptions& options = BlockerGenOptions{});

std::vector<Blocker> generate_cell_blockers(int col, int row, float cell_size);

std::vector<Blocker> create_stamp_rects(StampType type,
                                        float center_x,
                                        float center_y,
                                        float size,
                                        int cast_height,
                                        int softness);
