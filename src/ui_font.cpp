#include "ui_font.hpp"

#include <algorithm>
#include <cctype>

namespace {

struct GlyphDef {
    char ch;
    const char* rows[GLYPH_H];
};

// 'X' marks a lit pixel. Kept as pictures so glyphs can be edited by eye.
const GlyphDef GLYPHS[] = {
    {' ', {".....", ".....", ".....", ".....", ".....", ".....", "....."}},

    {'0', {".XXX.", "X...X", "X..XX", "X.X.X", "XX..X", "X...X", ".XXX."}},
    {'1', {"..X..", ".XX..", "..X..", "..X..", "..X..", "..X..", ".XXX."}},
    {'2', {".XXX.", "X...X", "....X", "...X.", "..X..", ".X...", "XXXXX"}},
    {'3', {"XXXX.", "....X", "....X", ".XXX.", "....X", "....X", "XXXX."}},
    {'4', {"...X.", "..XX.", ".X.X.", "X..X.", "XXXXX", "...X.", "...X."}},
    {'5', {"XXXXX", "X....", "XXXX.", "....X", "....X", "X...X", ".XXX."}},
    {'6', {"..XX.", ".X...", "X....", "XXXX.", "X...X", "X...X", ".XXX."}},
    {'7', {"XXXXX", "....X", "...X.", "..X..", ".X...", ".X...", ".X..."}},
    {'8', {".XXX.", "X...X", "X...X", ".XXX.", "X...X", "X...X", ".XXX."}},
    {'9', {".XXX.", "X...X", "X...X", ".XXXX", "....X", "...X.", ".XX.."}},

    {'A', {"..X..", ".X.X.", "X...X", "X...X", "XXXXX", "X...X", "X...X"}},
    {'B', {"XXXX.", "X...X", "X...X", "XXXX.", "X...X", "X...X", "XXXX."}},
    {'C', {".XXXX", "X....", "X....", "X....", "X....", "X....", ".XXXX"}},
    {'D', {"XXX..", "X..X.", "X...X", "X...X", "X...X", "X..X.", "XXX.."}},
    {'E', {"XXXXX", "X....", "X....", "XXXX.", "X....", "X....", "XXXXX"}},
    {'F', {"XXXXX", "X....", "X....", "XXXX.", "X....", "X....", "X...."}},
    {'G', {".XXXX", "X....", "X....", "X.XXX", "X...X", "X...X", ".XXX."}},
    {'H', {"X...X", "X...X", "X...X", "XXXXX", "X...X", "X...X", "X...X"}},
    {'I', {"XXXXX", "..X..", "..X..", "..X..", "..X..", "..X..", "XXXXX"}},
    {'J', {"..XXX", "...X.", "...X.", "...X.", "...X.", "X..X.", ".XX.."}},
    {'K', {"X...X", "X..X.", "X.X..", "XX...", "X.X..", "X..X.", "X...X"}},
    {'L', {"X....", "X....", "X....", "X....", "X....", "X....", "XXXXX"}},
    {'M', {"X...X", "XX.XX", "X.X.X", "X.X.X", "X...X", "X...X", "X...X"}},
    {'N', {"X...X", "XX..X", "XX..X", "X.X.X", "X..XX", "X..XX", "X...X"}},
    {'O', {".XXX.", "X...X", "X...X", "X...X", "X...X", "X...X", ".XXX."}},
    {'P', {"XXXX.", "X...X", "X...X", "XXXX.", "X....", "X....", "X...."}},
    {'Q', {".XXX.", "X...X", "X...X", "X...X", "X.X.X", "X..X.", ".XX.X"}},
    {'R', {"XXXX.", "X...X", "X...X", "XXXX.", "X.X..", "X..X.", "X...X"}},
    {'S', {".XXXX", "X....", "X....", ".XXX.", "....X", "....X", "XXXX."}},
    {'T', {"XXXXX", "..X..", "..X..", "..X..", "..X..", "..X..", "..X.."}},
    {'U', {"X...X", "X...X", "X...X", "X...X", "X...X", "X...X", ".XXX."}},
    {'V', {"X...X", "X...X", "X...X", "X...X", ".X.X.", ".X.X.", "..X.."}},
    {'W', {"X...X", "X...X", "X...X", "X.X.X", "X.X.X", "XX.XX", "X...X"}},
    {'X', {"X...X", ".X.X.", ".X.X.", "..X..", ".X.X.", ".X.X.", "X...X"}},
    {'Y', {"X...X", "X...X", ".X.X.", "..X..", "..X..", "..X..", "..X.."}},
    {'Z', {"XXXXX", "....X", "...X.", "..X..", ".X...", "X....", "XXXXX"}},

    // Map symbols
    {'#', {".X.X.", ".X.X.", "XXXXX", ".X.X.", "XXXXX", ".X.X.", ".X.X."}},
    {'^', {"..X..", ".X.X.", "X...X", ".....", ".....", ".....", "....."}},
    {'+', {".....", "..X..", "..X..", "XXXXX", "..X..", "..X..", "....."}},

    {'.', {".....", ".....", ".....", ".....", ".....", ".XX..", ".XX.."}},
    {',', {".....", ".....", ".....", ".....", ".XX..", "..X..", ".X..."}},
    {'!', {"..X..", "..X..", "..X..", "..X..", "..X..", ".....", "..X.."}},
    {'?', {".XXX.", "X...X", "....X", "..XX.", "..X..", ".....", "..X.."}},
    {':', {".....", ".XX..", ".XX..", ".....", ".XX..", ".XX..", "....."}},
    {'-', {".....", ".....", ".....", ".XXX.", ".....", ".....", "....."}},
    {'/', {"....X", "...X.", "...X.", "..X..", ".X...", ".X...", "X...."}},
    {'%', {"XX..X", "XX.X.", "...X.", "..X..", ".X...", ".X.XX", "X..XX"}},
    {'(', {"...X.", "..X..", ".X...", ".X...", ".X...", "..X..", "...X."}},
    {')', {".X...", "..X..", "...X.", "...X.", "...X.", "..X..", ".X..."}},
    {'=', {".....", ".....", "XXXXX", ".....", "XXXXX", ".....", "....."}},
    {'\'', {"..X..", "..X..", ".X...", ".....", ".....", ".....", "....."}},
    {'"', {".X.X.", ".X.X.", ".....", ".....", ".....", ".....", "....."}},
    {'<', {"...X.", "..X..", ".X...", "X....", ".X...", "..X..", "...X."}},
    {'>', {".X...", "..X..", "...X.", "....X", "...X.", "..X..", ".X..."}},
};

const GlyphDef* findGlyph(char c) {
    const char up = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    for (const GlyphDef& g : GLYPHS) {
        if (g.ch == up) return &g;
    }
    return nullptr;
}

Glyph5x7 decode(const GlyphDef& def) {
    Glyph5x7 g{};
    for (int row = 0; row < GLYPH_H; ++row) {
        uint8_t bits = 0;
        for (int col = 0; col < GLYPH_W; ++col) {
            bits = static_cast<uint8_t>(bits << 1);
            if (def.rows[row][col] == 'X') bits |= 1u;
        }
        g.rows[row] = bits;
    }
    return g;
}

} // namespace

bool hasGlyph(char c) {
    return findGlyph(c) != nullptr;
}

Glyph5x7 glyph5x7(char c) {
    const GlyphDef* def = findGlyph(c);
    if (!def) def = findGlyph('?');
    return decode(*def);
}

std::vector<std::string> wrapText(const std::string& text, int maxChars) {
    maxChars = std::max(1, maxChars);
    const size_t limit = static_cast<size_t>(maxChars);

    std::vector<std::string> lines;
    std::string line;
    std::string word;

    auto placeWord = [&]() {
        if (word.empty()) return;
        while (word.size() > limit) {
            if (!line.empty()) {
                lines.push_back(line);
                line.clear();
            }
            lines.push_back(word.substr(0, limit));
            word.erase(0, limit);
        }
        if (line.empty()) {
            line = word;
        } else if (line.size() + 1 + word.size() <= limit) {
            line += ' ';
            line += word;
        } else {
            lines.push_back(line);
            line = word;
        }
        word.clear();
    };

    for (char ch : text) {
        if (ch == '\n') {
            placeWord();
            lines.push_back(line);
            line.clear();
        } else if (ch == ' ' || ch == '\t' || ch == '\r') {
            placeWord();
        } else {
            word.push_back(ch);
        }
    }
    placeWord();
    if (!line.empty()) lines.push_back(line);
    return lines;
}
