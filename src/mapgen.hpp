#pragma once

#include "difficulty.hpp"
#include "grid.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>

enum class MapGenError : uint8_t {
    None = 0,
    // Feature counts do not fit (or the difficulty is otherwise malformed).
    InvalidConfiguration,
    // Every attempt walled off the exit.
    UnsolvableLayout,
};

inline const char* mapGenErrorName(MapGenError e) {
    switch (e) {
        case MapGenError::None:                 return "None";
        case MapGenError::InvalidConfiguration: return "InvalidConfiguration";
        case MapGenError::UnsolvableLayout:     return "UnsolvableLayout";
    }
    return "Unknown";
}

struct MapGenOptions {
    int maxAttempts = 50;

    // Keep medkits off the cells touching start and exit when possible.
    bool medkitsAvoidCorners = true;
};

struct MapGenReport {
    MapGenError error = MapGenError::None;
    int attempts = 0;
};

// Builds a grid for `diff`: Exit at the far corner, start cell left Empty,
// features placed in distinct random cells, and a guaranteed non-Wall path
// from start to exit. Drone cells mark initial drone positions.
//
// Returns false (grid untouched) on InvalidConfiguration or UnsolvableLayout.
bool generateMap(const Difficulty& diff,
                 RNG& rng,
                 Grid& out,
                 const MapGenOptions& opt = {},
                 MapGenReport* report = nullptr,
                 std::string* err = nullptr);
