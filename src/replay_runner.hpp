#pragma once

#include "game_state.hpp"
#include "replay.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>

// Headless replay runner: rebuilds the run from (seed, difficulty), applies
// the recorded moves in order and validates state-hash checkpoints.
//
// Used by signalvault_headless and the tests; no SDL, no terminal.

struct ReplayRunOptions {
    // If true and the replay contains StateHash events, validate them.
    bool verifyHashes = true;

    // Stop with SafetyLimit after this many moves (0 = unlimited).
    uint32_t maxMoves = 0;
};

// Failure categories for tooling. Append-only.
enum class ReplayFailureKind : uint8_t {
    None = 0,
    MapGen,          // the recorded seed no longer produces a map
    TurnMismatch,    // a move was recorded at a different turn than reached
    MoveAfterEnd,    // moves continue after Victory/Defeat
    HashMismatch,
    SafetyLimit,
    Parse,           // the file itself could not be loaded
};

inline const char* replayFailureKindName(ReplayFailureKind k) {
    switch (k) {
        case ReplayFailureKind::None:         return "None";
        case ReplayFailureKind::MapGen:       return "MapGen";
        case ReplayFailureKind::TurnMismatch: return "TurnMismatch";
        case ReplayFailureKind::MoveAfterEnd: return "MoveAfterEnd";
        case ReplayFailureKind::HashMismatch: return "HashMismatch";
        case ReplayFailureKind::SafetyLimit:  return "SafetyLimit";
        case ReplayFailureKind::Parse:        return "Parse";
    }
    return "Unknown";
}

struct ReplayRunStats {
    uint32_t movesApplied = 0;
    uint32_t checkpointsVerified = 0;
    uint32_t turns = 0;
    RunOutcome outcome = RunOutcome::InProgress;
    uint64_t finalHash = 0;

    // Filled if the run fails.
    ReplayFailureKind failure = ReplayFailureKind::None;
    uint32_t failedTurn = 0;
    uint64_t expectedHash = 0;
    uint64_t gotHash = 0;
};

// Builds the initial state and the turn RNG exactly as a live run does.
bool prepareStateForReplay(const ReplayFile& replay, GameState& state, RNG& rng, std::string* err = nullptr);

// Returns true when every move applied cleanly and every checkpoint matched.
bool runReplayHeadless(const ReplayFile& replay,
                       const ReplayRunOptions& opt = {},
                       ReplayRunStats* outStats = nullptr,
                       std::string* err = nullptr);
