#include "input.hpp"

#include <algorithm>
#include <cctype>

const char* inputCommandName(InputCommand c) {
    switch (c) {
        case InputCommand::None:  return "none";
        case InputCommand::Up:    return "up";
        case InputCommand::Down:  return "down";
        case InputCommand::Left:  return "left";
        case InputCommand::Right: return "right";
        case InputCommand::Quit:  return "quit";
    }
    return "none";
}

std::optional<Direction> commandDirection(InputCommand c) {
    switch (c) {
        case InputCommand::Up:    return Direction::Up;
        case InputCommand::Down:  return Direction::Down;
        case InputCommand::Left:  return Direction::Left;
        case InputCommand::Right: return Direction::Right;
        case InputCommand::None:
        case InputCommand::Quit:
            break;
    }
    return std::nullopt;
}

InputCommand commandFromChar(char c) {
    switch (std::tolower(static_cast<unsigned char>(c))) {
        case 'w': return InputCommand::Up;
        case 's': return InputCommand::Down;
        case 'a': return InputCommand::Left;
        case 'd': return InputCommand::Right;
        case 'q': return InputCommand::Quit;
        default:  break;
    }
    return InputCommand::None;
}

InputCommand commandFromLine(const std::string& line) {
    std::string v;
    v.reserve(line.size());
    for (unsigned char c : line) {
        if (!std::isspace(c)) v.push_back(static_cast<char>(std::tolower(c)));
    }

    if (v.size() == 1) return commandFromChar(v[0]);
    if (v == "quit" || v == "exit") return InputCommand::Quit;
    if (v == "up") return InputCommand::Up;
    if (v == "down") return InputCommand::Down;
    if (v == "left") return InputCommand::Left;
    if (v == "right") return InputCommand::Right;
    return InputCommand::None;
}

InputCommand TermKeyDecoder::feed(unsigned char byte) {
    switch (state_) {
        case State::Idle:
            if (byte == 0x1B) {
                state_ = State::Esc;
                return InputCommand::None;
            }
            return commandFromChar(static_cast<char>(byte));

        case State::Esc:
            if (byte == '[' || byte == 'O') {
                state_ = State::Csi;
                return InputCommand::None;
            }
            // ESC followed by something else: treat the ESC as quit.
            state_ = State::Idle;
            return InputCommand::Quit;

        case State::Csi:
            // Parameter bytes (e.g. "1;2") are skipped until the final byte.
            if ((byte >= '0' && byte <= '9') || byte == ';') return InputCommand::None;
            state_ = State::Idle;
            switch (byte) {
                case 'A': return InputCommand::Up;
                case 'B': return InputCommand::Down;
                case 'C': return InputCommand::Right;
                case 'D': return InputCommand::Left;
                default:  return InputCommand::None;
            }
    }
    state_ = State::Idle;
    return InputCommand::None;
}

InputCommand TermKeyDecoder::flush() {
    const bool loneEsc = state_ == State::Esc;
    state_ = State::Idle;
    return loneEsc ? InputCommand::Quit : InputCommand::None;
}
