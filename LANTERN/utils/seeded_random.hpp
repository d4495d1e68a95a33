#pragma once

#include <cstdint>
#include <string>

/*
  deterministic 32 bit generator (mulberry32)
  same seed gives the same sequence on every platform and run
*/

class SeededRandom {
    uint32_t seed_;
    uint32_t state_;

    public:
        explicit SeededRandom(uint32_t seed);
        explicit SeededRandom(const std::string& seed);

        uint32_t seed() const { return seed_; }

        uint32_t next_u32();
        double next();
        int next_int(int max);
        int rand_range(int min, int max);
        float rand_float(float min, float max);
        bool coin_flip();

        static uint32_t hash_seed(const std::string& str);
        static uint32_t seed_from_grid(int col, int row);
};
