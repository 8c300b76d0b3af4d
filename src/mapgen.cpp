#include "mapgen.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace {

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

bool touchesCorner(const Grid& g, Vec2i p) {
    return manhattan(p, g.start()) == 1 || manhattan(p, g.exit()) == 1;
}

// Takes `count` random cells out of `freeCells` and stamps them with `kind`.
// With `avoidCorners`, cells next to start/exit are used only once nothing else is left.
void placeFeature(Grid& g, RNG& rng, std::vector<Vec2i>& freeCells, CellKind kind, int count,
                  bool avoidCorners) {
    for (int i = 0; i < count; ++i) {
        std::vector<size_t> candidates;
        candidates.reserve(freeCells.size());
        if (avoidCorners) {
            for (size_t j = 0; j < freeCells.size(); ++j) {
                if (!touchesCorner(g, freeCells[j])) candidates.push_back(j);
            }
        }
        if (candidates.empty()) {
            for (size_t j = 0; j < freeCells.size(); ++j) candidates.push_back(j);
        }
        if (candidates.empty()) return; // validated earlier; cannot happen

        const size_t pick = candidates[rng.index(candidates.size())];
        g.at(freeCells[pick]) = kind;
        freeCells[pick] = freeCells.back();
        freeCells.pop_back();
    }
}

void layoutOnce(const Difficulty& diff, RNG& rng, const MapGenOptions& opt, Grid& g) {
    g = Grid(diff.width, diff.height);
    g.at(g.exit()) = CellKind::Exit;

    std::vector<Vec2i> freeCells;
    freeCells.reserve(g.cells.size());
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            const Vec2i p{x, y};
            if (p == g.start() || p == g.exit()) continue;
            freeCells.push_back(p);
        }
    }

    placeFeature(g, rng, freeCells, CellKind::Wall, diff.wallCount, false);
    placeFeature(g, rng, freeCells, CellKind::Trap, diff.trapCount, false);
    placeFeature(g, rng, freeCells, CellKind::Medkit, diff.medkitCount, opt.medkitsAvoidCorners);
    placeFeature(g, rng, freeCells, CellKind::Helper, diff.helperCount, false);
    placeFeature(g, rng, freeCells, CellKind::Drone, diff.droneCount, false);
}

} // namespace

bool generateMap(const Difficulty& diff,
                 RNG& rng,
                 Grid& out,
                 const MapGenOptions& opt,
                 MapGenReport* report,
                 std::string* err) {
    MapGenReport local;
    MapGenReport& rep = report ? *report : local;
    rep = MapGenReport{};

    std::string why;
    if (!validateDifficulty(diff, &why)) {
        rep.error = MapGenError::InvalidConfiguration;
        setErr(err, "Invalid difficulty '" + diff.key + "': " + why);
        return false;
    }

    const int maxAttempts = std::max(1, opt.maxAttempts);
    Grid g;
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        rep.attempts = attempt;
        layoutOnce(diff, rng, opt, g);
        if (pathExists(g, g.start(), g.exit())) {
            out = std::move(g);
            return true;
        }
    }

    rep.error = MapGenError::UnsolvableLayout;
    std::ostringstream ss;
    ss << "No solvable " << diff.width << "x" << diff.height << " layout after "
       << maxAttempts << " attempts";
    setErr(err, ss.str());
    return false;
}
