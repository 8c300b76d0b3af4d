#include "grid.hpp"

#include <algorithm>
#include <queue>

Grid::Grid(int w, int h) : width(w), height(h) {
    cells.assign(static_cast<size_t>(std::max(0, w) * std::max(0, h)), CellKind::Empty);
}

bool Grid::isTraversable(int x, int y) const {
    return inBounds(x, y) && at(x, y) != CellKind::Wall;
}

int Grid::count(CellKind k) const {
    return static_cast<int>(std::count(cells.begin(), cells.end(), k));
}

const char* cellKindName(CellKind k) {
    switch (k) {
        case CellKind::Empty:  return "Empty";
        case CellKind::Wall:   return "Wall";
        case CellKind::Trap:   return "Trap";
        case CellKind::Medkit: return "Medkit";
        case CellKind::Exit:   return "Exit";
        case CellKind::Drone:  return "Drone";
        case CellKind::Helper: return "Helper";
    }
    return "Unknown";
}

char cellSymbol(CellKind k) {
    switch (k) {
        case CellKind::Empty:  return ' ';
        case CellKind::Wall:   return '#';
        case CellKind::Trap:   return '^';
        case CellKind::Medkit: return '+';
        case CellKind::Exit:   return 'E';
        case CellKind::Drone:  return 'D';
        case CellKind::Helper: return 'H';
    }
    return '?';
}

std::vector<Vec2i> neighbors4(const Grid& g, Vec2i p) {
    static const int dirs[4][2] = {
        {0, 1}, {0, -1}, {1, 0}, {-1, 0},
    };

    std::vector<Vec2i> out;
    out.reserve(4);
    for (const auto& d : dirs) {
        const Vec2i n{p.x + d[0], p.y + d[1]};
        if (g.inBounds(n)) out.push_back(n);
    }
    return out;
}

bool pathExists(const Grid& g, Vec2i from, Vec2i to) {
    if (!g.isTraversable(from) || !g.isTraversable(to)) return false;
    if (from == to) return true;

    std::vector<uint8_t> visited(g.cells.size(), 0);
    auto idx = [&](Vec2i p) { return static_cast<size_t>(p.y * g.width + p.x); };

    std::queue<Vec2i> q;
    q.push(from);
    visited[idx(from)] = 1;

    while (!q.empty()) {
        const Vec2i p = q.front();
        q.pop();

        for (const Vec2i& n : neighbors4(g, p)) {
            if (!g.isTraversable(n)) continue;
            const size_t id = idx(n);
            if (visited[id]) continue;
            if (n == to) return true;
            visited[id] = 1;
            q.push(n);
        }
    }
    return false;
}
