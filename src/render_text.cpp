#include "render_text.hpp"

#include <iomanip>
#include <sstream>

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_DIM = "\x1b[2m";

const char* symbolColor(char sym) {
    switch (sym) {
        case 'P': return ANSI_GREEN;
        case 'E': return ANSI_YELLOW;
        case '+': return ANSI_GREEN;
        case '^': return ANSI_RED;
        case 'D': return ANSI_RED;
        case 'H': return ANSI_CYAN;
        case '#': return ANSI_DIM;
        default:  return nullptr;
    }
}

void paint(std::ostringstream& out, bool color, const char* code, const std::string& text) {
    if (color && code) out << code << text << ANSI_RESET;
    else out << text;
}

} // namespace

void MessageLog::push(const std::string& msg) {
    if (msg.empty()) return;
    lines_.push_back(msg);
    while (lines_.size() > capacity_) lines_.pop_front();
}

char boardSymbolAt(const GameState& s, Vec2i p) {
    if (p == s.player.pos) return PLAYER_SYMBOL;
    if (s.droneAt(p)) return cellSymbol(CellKind::Drone);
    return cellSymbol(s.grid.at(p));
}

std::string renderBoard(const GameState& s, const MessageLog& log, const TextRenderOptions& opt) {
    std::ostringstream out;

    paint(out, opt.color, ANSI_CYAN,
          "[P] you  [E] exit  [#] wall  [^] trap (-1 hp)  [+] medkit (+1 hp)  [D] drone  [H] helper");
    out << "\n";
    if (!opt.controlsHint.empty()) {
        paint(out, opt.color, ANSI_CYAN, opt.controlsHint);
        out << "\n";
    }

    out << "Difficulty: " << s.difficulty.name
        << "   Health: " << s.player.health << "/" << s.player.maxHealth
        << "   Turn: " << s.turn << "\n";

    const int w = s.grid.width;
    const int h = s.grid.height;

    // Two characters per column so indices >= 10 stay aligned.
    out << "    ";
    for (int x = 0; x < w; ++x) out << std::setw(2) << x;
    out << "\n";

    for (int y = 0; y < h; ++y) {
        out << std::setw(2) << y << " |";
        for (int x = 0; x < w; ++x) {
            const char sym = boardSymbolAt(s, {x, y});
            out << ' ';
            paint(out, opt.color, symbolColor(sym), std::string(1, sym));
        }
        out << "\n";
    }

    paint(out, opt.color, ANSI_CYAN, "=== Recent events ===");
    out << "\n";

    size_t shown = 0;
    if (log.size() == 0) {
        out << "(no recent events)\n";
        shown = 1;
    } else {
        for (const std::string& line : log.lines()) {
            out << line << "\n";
            ++shown;
        }
    }
    // Fixed footer height keeps redraws from jumping.
    for (; shown < log.capacity(); ++shown) out << "\n";

    return out.str();
}

const char* ansiClearScreen() {
    return "\x1b[2J\x1b[H";
}
