#include "blocker_generator.hpp"
#include "utils/seeded_random.hpp"
#include <algorithm>
#include <cmath>

std::vector<Blocker> generate_blockers(uint32_t seed, const BlockerGenOptions& options) {
    SeededRandom rng(seed);
    std::vector<Blocker> out;

    const float usable = options.cell_size - options.inset * 2.0f;
    if (usable <= 0.0f) return out;

    const int count = rng.rand_range(options.min_count, options.max_count);
    out.reserve(static_cast<size_t>(std::max(0, count)));

    for (int i = 0; i < count; ++i) {
        Blocker b;
        b.width  = std::min(static_cast<float>(rng.rand_range(options.min_width, options.max_width)), usable);
        b.height = std::min(static_cast<float>(rng.rand_range(options.min_height, options.max_height)), usable);

        const float span_x = std::max(0.0f, usable - b.width);
        const float span_y = std::max(0.0f, usable - b.height);
        b.x = std::round(options.inset + static_cast<float>(rng.next()) * span_x);
        b.y = std::round(options.inset + static_cast<float>(rng.next()) * span_y);

        b.cast_height = clamp_1_to_9(static_cast<double>(rng.rand_range(options.min_cast_height, options.max_cast_height)),
                                     kDefaultCastHeight);
        b.softness    = clamp_1_to_9(static_cast<double>(rng.rand_range(options.min_softness, options.max_softness)),
                                     kDefaultSoftness);
        out.push_back(b);
    }
    return out;
}

std::vector<Blocker> generate_cell_blockers(int col, int row, float cell_size) {
    BlockerGenOptions options;
    options.cell_size = cell_size;
    return generate_blockers(SeededRandom::seed_from_grid(col, row), options);
}

namespace {

Blocker centered_rect(float cx, float cy, float w, float h, int cast_height, int softness) {
    Blocker b;
    b.x = cx - w * 0.5f;
    b.y = cy - h * 0.5f;
    b.width = w;
    b.height = h;
    b.cast_height = cast_height;
    b.softness = softness;
    return b;
}

}

std::vector<Blocker> create_stamp_rects(StampType type,
                                        float center_x,
                                        float center_y,
                                        float size,
                                        int cast_height,
                                        int softness) {
    std::vector<Blocker> rects;
    if (!std::isfinite(size) || size <= 0.0f) return rects;

    const int ch = clamp_1_to_9(static_cast<double>(cast_height), kDefaultCastHeight);
    const int sf = clamp_1_to_9(static_cast<double>(softness), kDefaultSoftness);

    if (type == StampType::Square) {
        rects.push_back(centered_rect(center_x, center_y, size, size, ch, sf));
        return rects;
    }

    const float core      = std::max(4.0f, size * 0.22f);
    const float arm_thick = std::max(3.0f, size * 0.18f);
    const float arm_half  = size * 0.45f;
    const float corner    = std::max(3.0f, size * 0.16f);
    const float near_off  = arm_half - corner * 0.5f;

    rects.push_back(centered_rect(center_x, center_y, core, core, ch, sf));
    rects.push_back(centered_rect(center_x, center_y, arm_thick, arm_half * 2.0f, ch, sf));
    rects.push_back(centered_rect(center_x, center_y, arm_half * 2.0f, arm_thick, ch, sf));
    // corner squares sit inside the arms' bounding box
    rects.push_back(centered_rect(center_x - near_off, center_y - near_off, corner, corner, ch, sf));
    rects.push_back(centered_rect(center_x + near_off, center_y - near_off, corner, corner, ch, sf));
    rects.push_back(centered_rect(center_x - near_off, center_y + near_off, corner, corner, ch, sf));
    rects.push_back(centered_rect(center_x + near_off, center_y + near_off, corner, corner, ch, sf));
    return rects;
}
