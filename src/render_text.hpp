#pragma once

#include "game_state.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

// Most recent messages, oldest first. Empty messages are dropped.
class MessageLog {
public:
    explicit MessageLog(size_t capacity = 5) : capacity_(capacity ? capacity : 1) {}

    void push(const std::string& msg);
    void clear() { lines_.clear(); }

    size_t size() const { return lines_.size(); }
    size_t capacity() const { return capacity_; }
    const std::deque<std::string>& lines() const { return lines_; }

private:
    size_t capacity_;
    std::deque<std::string> lines_;
};

struct TextRenderOptions {
    bool color = true;

    // Shown under the header; front ends put a control hint here.
    std::string controlsHint = "Controls: WASD or arrow keys, Q to quit";
};

// Renders the board and the message log as terminal text:
//   legend line, "Difficulty / Health / Turn" line, column-indexed grid
//   (one symbol per cell, player drawn over whatever it stands on, drones
//   from the drone list), then a "Recent events" block padded to the log
//   capacity. Lines are '\n'-terminated.
std::string renderBoard(const GameState& s, const MessageLog& log, const TextRenderOptions& opt = {});

// Symbol drawn at a cell, combining grid, drones and player.
char boardSymbolAt(const GameState& s, Vec2i p);

// ANSI clear + home, for redrawing in place.
const char* ansiClearScreen();
