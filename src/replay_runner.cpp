#include "replay_runner.hpp"

#include "turn.hpp"

#include <sstream>

namespace {

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

std::string formatHashMismatch(uint32_t turn, uint64_t expected, uint64_t got) {
    std::ostringstream ss;
    ss << "REPLAY DESYNC at turn " << turn
       << " (expected 0x" << formatReplayHash(expected)
       << ", got 0x" << formatReplayHash(got) << ")";
    return ss.str();
}

} // namespace

bool prepareStateForReplay(const ReplayFile& replay, GameState& state, RNG& rng, std::string* err) {
    rng = RNG(replay.meta.seed);

    MapGenReport report;
    std::string genErr;
    if (!newGameState(difficultyPreset(replay.meta.difficulty), rng, state, &report, &genErr)) {
        setErr(err, std::string("replay map generation failed (") + mapGenErrorName(report.error) + "): " + genErr);
        return false;
    }
    return true;
}

bool runReplayHeadless(const ReplayFile& replay,
                       const ReplayRunOptions& opt,
                       ReplayRunStats* outStats,
                       std::string* err) {
    ReplayRunStats stats;

    auto finish = [&](const GameState& s, ReplayFailureKind failure) {
        stats.turns = s.turn;
        stats.outcome = s.outcome;
        stats.finalHash = stateHash(s);
        stats.failure = failure;
        if (outStats) *outStats = stats;
        return failure == ReplayFailureKind::None;
    };

    GameState state;
    RNG rng;
    if (!prepareStateForReplay(replay, state, rng, err)) {
        stats.failure = ReplayFailureKind::MapGen;
        if (outStats) *outStats = stats;
        return false;
    }

    for (const ReplayEvent& ev : replay.events) {
        if (ev.kind == ReplayEventType::StateHash) {
            if (!opt.verifyHashes) continue;

            const uint64_t got = stateHash(state);
            if (ev.turn != state.turn || ev.hash != got) {
                stats.failedTurn = state.turn;
                stats.expectedHash = ev.hash;
                stats.gotHash = got;
                if (ev.turn != state.turn) {
                    std::ostringstream ss;
                    ss << "REPLAY DESYNC: checkpoint for turn " << ev.turn
                       << " reached at turn " << state.turn;
                    setErr(err, ss.str());
                } else {
                    setErr(err, formatHashMismatch(state.turn, ev.hash, got));
                }
                return finish(state, ReplayFailureKind::HashMismatch);
            }
            ++stats.checkpointsVerified;
            continue;
        }

        if (state.isOver()) {
            stats.failedTurn = state.turn;
            setErr(err, "replay has moves after the run ended (" +
                        std::string(runOutcomeName(state.outcome)) + " at turn " +
                        std::to_string(state.turn) + ")");
            return finish(state, ReplayFailureKind::MoveAfterEnd);
        }
        if (ev.turn != state.turn) {
            stats.failedTurn = state.turn;
            setErr(err, "move recorded at turn " + std::to_string(ev.turn) +
                        " but the run is at turn " + std::to_string(state.turn));
            return finish(state, ReplayFailureKind::TurnMismatch);
        }
        if (opt.maxMoves != 0 && stats.movesApplied >= opt.maxMoves) {
            stats.failedTurn = state.turn;
            setErr(err, "replay exceeded the move limit (" + std::to_string(opt.maxMoves) + ")");
            return finish(state, ReplayFailureKind::SafetyLimit);
        }

        stepTurn(state, ev.dir, rng);
        ++stats.movesApplied;
    }

    return finish(state, ReplayFailureKind::None);
}
