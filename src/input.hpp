#pragma once

#include "turn.hpp"

#include <cstdint>
#include <optional>
#include <string>

// Abstract player intent. Front ends translate their own key events into
// this; only the movement commands ever reach the turn resolver.
enum class InputCommand : uint8_t {
    None = 0,
    Up,
    Down,
    Left,
    Right,
    Quit,
};

const char* inputCommandName(InputCommand c);

// Movement commands map to a direction; None/Quit do not.
std::optional<Direction> commandDirection(InputCommand c);

// Single keystroke (terminal): w/a/s/d (any case), q quits.
InputCommand commandFromChar(char c);

// Whole typed line (line-buffered terminals): a key, a direction name
// ("up") or "quit". Whitespace around the word is ignored.
InputCommand commandFromLine(const std::string& line);

// Decodes raw terminal bytes, including the ANSI arrow sequences
// ESC [ A..D (and ESC O A..D). Feed bytes one at a time; a command is
// returned once a complete key has been seen.
class TermKeyDecoder {
public:
    InputCommand feed(unsigned char byte);

    // A lone ESC with nothing after it counts as quit.
    InputCommand flush();

    bool pending() const { return state_ != State::Idle; }

private:
    enum class State : uint8_t { Idle, Esc, Csi };
    State state_ = State::Idle;
};
