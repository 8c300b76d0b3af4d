#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Built-in 5x7 bitmap font so the window front end needs no SDL_ttf.
// Lowercase letters are drawn as uppercase; characters without a glyph
// fall back to '?'.

constexpr int GLYPH_W = 5;
constexpr int GLYPH_H = 7;

struct Glyph5x7 {
    // 7 rows, low 5 bits used (bit 4 is the leftmost column).
    uint8_t rows[GLYPH_H];

    bool pixel(int col, int row) const {
        return (rows[row] >> (GLYPH_W - 1 - col)) & 1u;
    }
};

// True when `c` has its own glyph (after case folding).
bool hasGlyph(char c);

Glyph5x7 glyph5x7(char c);

// Greedy word wrap to at most `maxChars` per line. Explicit '\n' starts a
// new line; words longer than a line are split.
std::vector<std::string> wrapText(const std::string& text, int maxChars);
