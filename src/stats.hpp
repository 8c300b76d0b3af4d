#pragma once

#include <cstdint>
#include <map>
#include <string>

// Per-difficulty run history. Stored as a small CSV file (one row per
// difficulty key) next to the settings file.

struct DifficultyStats {
    uint32_t runs = 0;
    uint32_t wins = 0;
    uint32_t defeats = 0;
    uint32_t quits = 0;

    // Fewest turns of any win; -1 until the first win.
    int64_t bestTurns = -1;

    uint32_t winStreak = 0;
    uint32_t bestStreak = 0;
};

enum class RunResult : uint8_t {
    Victory = 0,
    Defeat,
    Quit,
};

const char* runResultName(RunResult r);

struct StatsResult {
    bool newBest = false;
    uint32_t streak = 0;
    uint32_t bestStreak = 0;
};

class StatsStore {
public:
    // A missing file loads as empty and returns true.
    bool load(const std::string& path, std::string* err = nullptr);

    // Writes every row (with header) through a temp file + rename.
    bool save(const std::string& path, std::string* err = nullptr) const;

    // Updates the in-memory record for `difficultyKey`. Defeats and quits
    // reset the current streak; a win with fewer turns than the previous
    // best (or the first win) sets newBest.
    StatsResult recordRun(const std::string& difficultyKey, uint32_t turns, RunResult result);

    // "runs N, wins W (P% rate), best T turns, streak S (best B)".
    std::string summaryLine(const std::string& difficultyKey) const;

    // nullptr when nothing was recorded for the key.
    const DifficultyStats* find(const std::string& difficultyKey) const;

    const std::map<std::string, DifficultyStats>& all() const { return stats_; }

private:
    std::map<std::string, DifficultyStats> stats_;
};
