#pragma once

#include "difficulty.hpp"
#include "turn.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <string>
#include <vector>

// Recorded runs (.svr files).
//
// SDL-free, line-based and human-readable. A run is fully determined by
// (seed, difficulty, moves), so only moves are recorded; state hash
// checkpoints let a player verify that a rebuild matches the recording.
//
// File format (v1):
//
//   @signalvault_replay 1
//   @game_version 0.3.0
//   @seed 123456
//   @difficulty normal
//   @end_header
//
//   <turn> M <U|D|L|R>        move issued while the counter read <turn>
//   <turn> H <hash64hex>      stateHash() once the counter reached <turn>
//
// Blank lines and lines starting with '#' are ignored.

enum class ReplayEventType : uint8_t {
    Move = 0,
    StateHash,
};

struct ReplayMeta {
    int formatVersion = 1;
    std::string gameVersion;
    uint32_t seed = 0;
    DifficultyId difficulty = DifficultyId::Normal;
};

struct ReplayEvent {
    uint32_t turn = 0;
    ReplayEventType kind = ReplayEventType::Move;

    Direction dir = Direction::Up; // Move
    uint64_t hash = 0;             // StateHash
};

struct ReplayFile {
    ReplayMeta meta;
    std::vector<ReplayEvent> events;

    size_t moveCount() const;
};

std::string formatReplayHash(uint64_t hash);

// Appends events as the run is played; each checkpoint is flushed so a
// crash leaves a usable prefix.
class ReplayWriter {
public:
    bool open(const std::filesystem::path& path, const ReplayMeta& meta, std::string* err = nullptr);
    void close();
    bool isOpen() const { return f_.is_open(); }
    std::filesystem::path path() const { return path_; }

    void writeMove(uint32_t turn, Direction d);
    void writeStateHash(uint32_t turn, uint64_t hash);

private:
    void writeLine_(const std::string& line);

    std::filesystem::path path_;
    std::ofstream f_;
};

// Whole-file text, same format as ReplayWriter produces.
std::string formatReplay(const ReplayFile& replay);

// Errors name the offending line: "line 7: bad direction 'X'".
bool parseReplay(std::istream& in, ReplayFile& out, std::string* err = nullptr);
bool loadReplayFile(const std::filesystem::path& path, ReplayFile& out, std::string* err = nullptr);
