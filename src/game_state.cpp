#include "game_state.hpp"

#include <algorithm>
#include <limits>

const char* turnTagName(TurnTag t) {
    switch (t) {
        case TurnTag::None:    return "None";
        case TurnTag::Bump:    return "Bump";
        case TurnTag::Moved:   return "Moved";
        case TurnTag::Trapped: return "Trapped";
        case TurnTag::Healed:  return "Healed";
        case TurnTag::Helped:  return "Helped";
        case TurnTag::Victory: return "Victory";
        case TurnTag::Defeat:  return "Defeat";
    }
    return "Unknown";
}

const char* runOutcomeName(RunOutcome o) {
    switch (o) {
        case RunOutcome::InProgress: return "in_progress";
        case RunOutcome::Victory:    return "victory";
        case RunOutcome::Defeat:     return "defeat";
    }
    return "unknown";
}

bool GameState::droneAt(Vec2i p) const {
    return std::any_of(drones.begin(), drones.end(), [&](const Drone& d) { return d.pos == p; });
}

int GameState::nearestDroneDistance() const {
    if (drones.empty()) return -1;
    int best = std::numeric_limits<int>::max();
    for (const Drone& d : drones) {
        best = std::min(best, manhattan(player.pos, d.pos));
    }
    return best;
}

GameState makeGameState(const Difficulty& diff, Grid grid, uint32_t seed) {
    GameState s;
    s.difficulty = diff;
    s.seed = seed;
    s.grid = std::move(grid);

    s.player.pos = s.grid.start();
    s.player.maxHealth = diff.maxHealth;
    s.player.health = std::min(diff.startHealth, diff.maxHealth);

    // Row-major scan keeps drone order (and thus motion order) stable.
    for (int y = 0; y < s.grid.height; ++y) {
        for (int x = 0; x < s.grid.width; ++x) {
            if (s.grid.at(x, y) != CellKind::Drone) continue;
            Drone d;
            d.pos = {x, y};
            s.drones.push_back(d);
            s.grid.at(x, y) = CellKind::Empty;
        }
    }
    return s;
}

bool newGameState(const Difficulty& diff,
                  RNG& rng,
                  GameState& out,
                  MapGenReport* report,
                  std::string* err) {
    const uint32_t seed = rng.state;
    Grid grid;
    if (!generateMap(diff, rng, grid, MapGenOptions{}, report, err)) return false;
    out = makeGameState(diff, std::move(grid), seed);
    return true;
}

uint64_t stateHash(const GameState& s) {
    Hash64 h;
    h.addI32(s.grid.width);
    h.addI32(s.grid.height);
    for (CellKind k : s.grid.cells) h.addByte(static_cast<uint8_t>(k));

    h.addI32(s.player.pos.x);
    h.addI32(s.player.pos.y);
    h.addI32(s.player.health);
    h.addI32(s.player.maxHealth);

    h.addU32(static_cast<uint32_t>(s.drones.size()));
    for (const Drone& d : s.drones) {
        h.addI32(d.pos.x);
        h.addI32(d.pos.y);
        h.addI32(d.frozenTurns);
    }

    h.addU32(s.turn);
    h.addByte(static_cast<uint8_t>(s.outcome));
    return h.h;
}
