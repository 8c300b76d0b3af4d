#pragma once

#include "common.hpp"
#include "difficulty.hpp"
#include "grid.hpp"
#include "mapgen.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Per-turn outcome tag. Exactly one is produced by each stepTurn() call.
// None only marks "no turn resolved yet". Append-only.
enum class TurnTag : uint8_t {
    None = 0,
    Bump,
    Moved,
    Trapped,
    Healed,
    Helped,
    Victory,
    Defeat,
};

const char* turnTagName(TurnTag t);

inline bool isTerminalTag(TurnTag t) {
    return t == TurnTag::Victory || t == TurnTag::Defeat;
}

enum class RunOutcome : uint8_t {
    InProgress = 0,
    Victory,
    Defeat,
};

const char* runOutcomeName(RunOutcome o);

struct Player {
    Vec2i pos{};
    int health = 0;
    int maxHealth = 0;
};

struct Drone {
    Vec2i pos{};
    // While > 0 the drone skips its move and counts down by one.
    int frozenTurns = 0;
};

// Everything that changes during one run. Owned by the driver loop; the
// resolver and the mood classifier only borrow it for the duration of a call.
struct GameState {
    Difficulty difficulty;
    Grid grid;
    Player player;
    std::vector<Drone> drones;

    uint32_t turn = 0;
    uint32_t seed = 0;
    RunOutcome outcome = RunOutcome::InProgress;
    TurnTag lastTag = TurnTag::None;

    bool isOver() const { return outcome != RunOutcome::InProgress; }

    bool droneAt(Vec2i p) const;

    // Manhattan distance to the closest drone, or -1 when there are none.
    int nearestDroneDistance() const;
};

// Wraps a generated grid into a fresh run: player on start at the
// difficulty's starting health, Drone cells lifted into the drone list.
GameState makeGameState(const Difficulty& diff, Grid grid, uint32_t seed = 0);

// Generates a map with `rng` and builds the run from it. The RNG's state on
// entry is recorded as the run seed; the same RNG then drives the turns.
bool newGameState(const Difficulty& diff,
                  RNG& rng,
                  GameState& out,
                  MapGenReport* report = nullptr,
                  std::string* err = nullptr);

// Stable digest of grid, player, drones, turn and outcome (replay checkpoints).
uint64_t stateHash(const GameState& s);
