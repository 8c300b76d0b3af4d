#pragma once
#include "common.hpp"
#include <cstdint>
#include <vector>

// Closed set of cell kinds. Append-only: replay hashes depend on the values.
enum class CellKind : uint8_t {
    Empty = 0,
    Wall,
    Trap,
    Medkit,
    Exit,
    Drone,
    Helper,
};

constexpr int CELL_KIND_COUNT = 7;

const char* cellKindName(CellKind k);

// Display symbol shared by every renderer.
char cellSymbol(CellKind k);

constexpr char PLAYER_SYMBOL = 'P';

class Grid {
public:
    int width = 0;
    int height = 0;
    std::vector<CellKind> cells;

    Grid() = default;
    Grid(int w, int h);

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }
    bool inBounds(Vec2i p) const { return inBounds(p.x, p.y); }

    CellKind& at(int x, int y) { return cells[static_cast<size_t>(y * width + x)]; }
    const CellKind& at(int x, int y) const { return cells[static_cast<size_t>(y * width + x)]; }
    CellKind& at(Vec2i p) { return at(p.x, p.y); }
    const CellKind& at(Vec2i p) const { return at(p.x, p.y); }

    // In bounds and not a wall. Hazards, items and drones do not block.
    bool isTraversable(int x, int y) const;
    bool isTraversable(Vec2i p) const { return isTraversable(p.x, p.y); }

    int count(CellKind k) const;

    Vec2i start() const { return {0, 0}; }
    Vec2i exit() const { return {width - 1, height - 1}; }
};

// Breadth-first search over traversable cells (4-neighbour).
bool pathExists(const Grid& g, Vec2i from, Vec2i to);

// Orthogonal neighbours inside the grid, in a fixed order (down, up, right, left).
std::vector<Vec2i> neighbors4(const Grid& g, Vec2i p);
