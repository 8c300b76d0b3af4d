#pragma once
#include <cstdint>
#include <cstddef>

// Compile-time tag hashing (FNV-1a), used to derive independent seeds
// from a run seed without magic constants.
//
// Example:
//   RNG narration(hashCombine(runSeed, tag32("NARRATE")));
constexpr uint32_t fnv1a32(const char* data, std::size_t len) {
    uint32_t h = 2166136261u;
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint8_t>(static_cast<unsigned char>(data[i]));
        h *= 16777619u;
    }
    return h;
}

template <std::size_t N>
constexpr uint32_t tag32(const char (&str)[N]) {
    return fnv1a32(str, (N > 0) ? (N - 1) : 0);
}

// Deterministic xorshift32 generator. Every random decision in the engine
// (map layout, drone motion) draws from an RNG the caller passes in, so a
// fixed seed reproduces a run exactly on every platform.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() {
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    // Uniform index in [0, n). n must be > 0.
    std::size_t index(std::size_t n) {
        if (n <= 1) return 0;
        return static_cast<std::size_t>(nextU32() % static_cast<uint32_t>(n));
    }
};

inline uint32_t hash32(uint32_t x) {
    x ^= x >> 16;
    x *= 0x7feb352du;
    x ^= x >> 15;
    x *= 0x846ca68bu;
    x ^= x >> 16;
    return x;
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return hash32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}

// 64-bit FNV-1a accumulator for state digests (replay checkpoints).
struct Hash64 {
    uint64_t h = 14695981039346656037ull;

    void addByte(uint8_t b) {
        h ^= b;
        h *= 1099511628211ull;
    }

    void addU32(uint32_t v) {
        for (int i = 0; i < 4; ++i) addByte(static_cast<uint8_t>((v >> (i * 8)) & 0xFFu));
    }

    void addI32(int32_t v) { addU32(static_cast<uint32_t>(v)); }
};
