#include "seeded_random.hpp"

    SeededRandom::SeededRandom(uint32_t seed)
        : seed_(seed), state_(seed) {}

    SeededRandom::SeededRandom(const std::string& seed)
        : SeededRandom(hash_seed(seed)) {}

    uint32_t SeededRandom::next_u32() {
        state_ += 0x6D2B79F5u;
        uint32_t t = state_;
        t = (t ^ (t >> 15)) * (t | 1u);
        t = (t + ((t ^ (t >> 7)) * (t | 61u))) ^ t;
        return t ^ (t >> 14);
    }

    double SeededRandom::next() {
        return static_cast<double>(next_u32()) / 4294967296.0;
    }

    int SeededRandom::next_int(int max) {
        if (max <= 0) return 0;
        return static_cast<int>(next() * static_cast<double>(max));
    }

    // inclusive on both ends
    int SeededRandom::rand_range(int min, int max) {
        if (max < min) return min;
        return min + next_int(max - min + 1);
    }

    float SeededRandom::rand_float(float min, float max) {
        return min + static_cast<float>(next()) * (max - min);
    }

    bool SeededRandom::coin_flip() {
        return next() < 0.5;
    }

    uint32_t SeededRandom::hash_seed(const std::string& str) {
        uint32_t h = 1779033703u ^ static_cast<uint32_t>(str.size());
        for (unsigned char c : str) {
            h = (h ^ c) * 3432918353u;
            h = (h << 13) | (h >> 19);
        }
        h = (h ^ (h >> 16)) * 2246822507u;
        h = (h ^ (h >> 13)) * 3266489909u;
        h ^= h >> 16;
        return h;
    }

    uint32_t SeededRandom::seed_from_grid(int col, int row) {
        uint32_t h = static_cast<uint32_t>(col) * 73856093u;
        h ^= static_cast<uint32_t>(row) * 19349663u;
        h ^= h >> 13;
        h *= 0x5bd1e995u;
        h ^= h >> 15;
        return h;
    }
