// src/core/Rng.h
#pragma once
#include <cstdint>
#include <numeric>
#include <random>
#include <utility>
#include <vector>

namespace minefield::rng {

using Seed = std::uint64_t;

// 64-bit mixing (turns small/sequential seeds into well-scrambled ones)
inline std::uint64_t mix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

// Child seed for the N-th game of a seeded session
inline Seed derive(Seed parent, std::uint64_t id) {
    return mix64(parent ^ mix64(id));
}

// Non-deterministic seed for unseeded sessions
inline Seed random_seed() {
    std::random_device rd;
    const std::uint64_t hi = static_cast<std::uint64_t>(rd());
    const std::uint64_t lo = static_cast<std::uint64_t>(rd());
    return (hi << 32) | lo;
}

// Minimal PCG32 (XSH-RR). One 64-bit state + 64-bit stream/sequence.
struct Pcg32 {
    std::uint64_t state = 0;
    std::uint64_t inc   = 0; // must be odd

    Pcg32() = default;
    explicit Pcg32(Seed initstate, Seed sequence = 0) { seed(initstate, sequence); }

    void seed(Seed initstate, Seed sequence = 0) {
        state = 0;
        inc   = (mix64(sequence) << 1u) | 1u;
        next_u32();
        state += mix64(initstate);
        next_u32();
    }

    std::uint32_t next_u32() {
        std::uint64_t old = state;
        state = old * 6364136223846793005ull + inc;
        std::uint32_t xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        std::uint32_t rot        = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-static_cast<int>(rot)) & 31));
    }

    // Uniform on [0, bound) without modulo bias (rejection method)
    std::uint32_t next_bounded(std::uint32_t bound) {
        std::uint32_t threshold = static_cast<std::uint32_t>(-bound) % bound;
        for (;;) {
            std::uint32_t r = next_u32();
            if (r >= threshold) return r % bound;
        }
    }
};

// `count` distinct values from [0, population), uniformly, order irrelevant.
// Partial Fisher-Yates over the index range. Requires count <= population.
inline std::vector<std::uint32_t> sample_distinct(Pcg32& rng, std::uint32_t population, std::uint32_t count) {
    std::vector<std::uint32_t> pool(population);
    std::iota(pool.begin(), pool.end(), 0u);

    for (std::uint32_t i = 0; i < count; ++i) {
        const std::uint32_t j = i + rng.next_bounded(population - i);
        std::swap(pool[i], pool[j]);
    }

    pool.resize(count);
    return pool;
}

} // namespace minefield::rng
