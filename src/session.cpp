#include "session.hpp"

#include "version.hpp"

#include <iostream>
#include <stdexcept>

std::string turnNotice(const TurnResult& r, const GameState& s) {
    switch (r.tag) {
        case TurnTag::Bump:
            if (!s.grid.inBounds(r.target)) return "You bump into the perimeter.";
            return "That way is sealed by a wall.";
        case TurnTag::Trapped:
            return "A hidden spike nicks you. (-1 hp)";
        case TurnTag::Healed:
            return r.healthAfter > r.healthBefore ? "You patch yourself up. (+1 hp)"
                                                  : "You pocket a medkit you do not need yet.";
        case TurnTag::Helped:
            return "A friendly runner patches you up and jams the drones for " +
                   std::to_string(s.difficulty.helperFreezeTurns) + " turns.";
        case TurnTag::Victory:
            return "You jack the vault core and slip out the exit. Victory!";
        case TurnTag::Defeat:
            if (r.caught) return "A drone slams into you. Game over.";
            return "You collapse before reaching the exit. Game over.";
        case TurnTag::Moved:
        case TurnTag::None:
            break;
    }
    return {};
}

bool RunSession::start(const SessionConfig& cfg, std::string* err) {
    const Persona* persona = findPersona(cfg.narrator);
    if (!persona) {
        if (err) *err = "unknown narrator '" + cfg.narrator + "'";
        return false;
    }

    const Difficulty& diff = difficultyPreset(cfg.difficulty);

    uint32_t seed = cfg.seed;
    GameState fresh;
    RNG rng;
    bool ok = false;
    for (int attempt = 0; attempt <= cfg.maxReseeds; ++attempt) {
        rng = RNG(seed);
        MapGenReport report;
        std::string genErr;
        if (newGameState(diff, rng, fresh, &report, &genErr)) {
            ok = true;
            break;
        }
        if (report.error == MapGenError::InvalidConfiguration) {
            if (err) *err = genErr;
            return false;
        }
        std::cerr << "Seed " << seed << ": " << genErr << "; trying a new seed\n";
        seed = hashCombine(seed, tag32("RESEED") + static_cast<uint32_t>(attempt));
    }
    if (!ok) {
        if (err) *err = "no solvable layout after " + std::to_string(cfg.maxReseeds + 1) + " seeds";
        return false;
    }

    cfg_ = cfg;
    state_ = std::move(fresh);
    rng_ = rng;
    narrator_ = std::make_unique<Narrator>(*persona, state_.seed, cfg.narration);
    log_.clear();
    lastCue_ = SoundCue::Ambient;
    recorded_.reset();
    quit_ = false;
    started_ = true;

    replay_.close();
    replayPath_.clear();
    if (!cfg.replayPath.empty()) {
        ReplayMeta meta;
        meta.gameVersion = SIGNALVAULT_VERSION;
        meta.seed = state_.seed;
        meta.difficulty = cfg.difficulty;

        std::string rerr;
        if (replay_.open(cfg.replayPath, meta, &rerr)) {
            replayPath_ = cfg.replayPath;
            replay_.writeStateHash(state_.turn, stateHash(state_));
        } else {
            // Recording is optional; the run goes on without it.
            std::cerr << rerr << "\n";
        }
    }

    const Mood mood = classifyMood(state_);
    push(narrator_->describe(NarrationEvent::Start, narrationContext(state_, mood)));
    return true;
}

TurnResult RunSession::move(Direction d) {
    if (!started_) throw std::logic_error("RunSession::move before start");
    if (quit_) throw std::logic_error("RunSession::move after quit");

    const uint32_t turnBefore = state_.turn;
    const TurnResult r = stepTurn(state_, d, rng_);

    if (replay_.isOpen()) {
        replay_.writeMove(turnBefore, d);
        replay_.writeStateHash(state_.turn, stateHash(state_));
    }

    push(turnNotice(r, state_));

    const Mood mood = classifyMood(state_);
    for (const std::string& line : narrator_->narrateTurn(r, mood, state_)) push(line);

    lastCue_ = cueForTurn(r);
    if (r.terminal()) replay_.close();
    return r;
}

void RunSession::quit() {
    if (!started_ || over()) throw std::logic_error("RunSession::quit on a run that is not in progress");

    quit_ = true;
    replay_.close();
    lastCue_.reset();

    push("You abort the heist.");
    const Mood mood = classifyMood(state_);
    push(narrator_->describe(NarrationEvent::Quit, narrationContext(state_, mood)));
}

RunResult RunSession::result() const {
    if (state_.outcome == RunOutcome::Victory) return RunResult::Victory;
    if (state_.outcome == RunOutcome::Defeat) return RunResult::Defeat;
    return RunResult::Quit;
}

StatsResult RunSession::finish(StatsStore& stats) {
    if (!over()) throw std::logic_error("RunSession::finish before the run ended");
    if (recorded_) return *recorded_;

    const StatsResult sr = stats.recordRun(state_.difficulty.key, state_.turn, result());
    recorded_ = sr;

    NarrationContext ctx = narrationContext(state_, classifyMood(state_));
    ctx.streak = static_cast<int>(sr.streak);
    if (sr.newBest) push(narrator_->describe(NarrationEvent::Record, ctx));
    if (result() == RunResult::Victory && sr.streak >= 2) push(narrator_->describe(NarrationEvent::Streak, ctx));

    return sr;
}
