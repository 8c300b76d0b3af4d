#pragma once

#include "difficulty.hpp"
#include "game_state.hpp"
#include "mood.hpp"
#include "narrator.hpp"
#include "render_text.hpp"
#include "replay.hpp"
#include "rng.hpp"
#include "sfx.hpp"
#include "stats.hpp"
#include "turn.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

// One run from map generation to the stats update, shared by the terminal
// and window front ends. Owns the state, the turn RNG, the narrator, the
// message log and the optional replay recording; the front end owns input,
// drawing and audio.

struct SessionConfig {
    DifficultyId difficulty = DifficultyId::Normal;
    std::string narrator = "mentor";
    bool narration = true;

    // Run seed. If map generation reports UnsolvableLayout, the session
    // derives fresh seeds from it (up to maxReseeds times).
    uint32_t seed = 1;
    int maxReseeds = 8;

    // Empty: no recording.
    std::filesystem::path replayPath;
};

class RunSession {
public:
    RunSession() = default;

    // Generates the map and resets everything. Fails on InvalidConfiguration,
    // on an unknown narrator key, or if every reseed was unsolvable.
    bool start(const SessionConfig& cfg, std::string* err = nullptr);

    bool started() const { return started_; }

    // Resolves one turn and queues its messages. Same contract as stepTurn().
    TurnResult move(Direction d);

    // Ends the run early; only valid while the run is in progress.
    void quit();

    bool over() const { return quit_ || state_.isOver(); }
    bool quitRequested() const { return quit_; }

    // Victory/Defeat/Quit for a finished run.
    RunResult result() const;

    // Records the finished run once; later calls return the first result.
    // Adds record/streak narration to the log.
    StatsResult finish(StatsStore& stats);

    const GameState& state() const { return state_; }
    const MessageLog& log() const { return log_; }
    const Narrator& narrator() const { return *narrator_; }
    Mood mood() const { return classifyMood(state_); }

    // Sound for the most recent turn (or the quit/start), if any.
    std::optional<SoundCue> lastCue() const { return lastCue_; }

    const std::filesystem::path& replayPath() const { return replayPath_; }

private:
    void push(const std::string& msg) { log_.push(msg); }

    SessionConfig cfg_;
    GameState state_;
    RNG rng_;
    std::unique_ptr<Narrator> narrator_;
    MessageLog log_{5};
    ReplayWriter replay_;
    std::filesystem::path replayPath_;

    std::optional<SoundCue> lastCue_;
    std::optional<StatsResult> recorded_;
    bool started_ = false;
    bool quit_ = false;
};

// Plain event line for a turn ("A hidden spike nicks you. (-1 hp)").
// Empty for an uneventful move.
std::string turnNotice(const TurnResult& r, const GameState& s);
