#include "drone_ai.hpp"

namespace {

bool occupiedByOther(const std::vector<Drone>& drones, size_t self, Vec2i p) {
    for (size_t i = 0; i < drones.size(); ++i) {
        if (i != self && drones[i].pos == p) return true;
    }
    return false;
}

} // namespace

void advanceDrones(std::vector<Drone>& drones, const Grid& grid, RNG& rng) {
    std::vector<Vec2i> options;
    options.reserve(4);

    for (size_t i = 0; i < drones.size(); ++i) {
        Drone& d = drones[i];
        if (d.frozenTurns > 0) {
            --d.frozenTurns;
            continue;
        }

        options.clear();
        for (const Vec2i& n : neighbors4(grid, d.pos)) {
            if (!grid.isTraversable(n)) continue;
            if (occupiedByOther(drones, i, n)) continue;
            options.push_back(n);
        }
        if (options.empty()) continue;

        d.pos = options[rng.index(options.size())];
    }
}
