#include "turn.hpp"

#include "drone_ai.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

Vec2i directionDelta(Direction d) {
    switch (d) {
        case Direction::Up:    return {0, -1};
        case Direction::Down:  return {0, 1};
        case Direction::Left:  return {-1, 0};
        case Direction::Right: return {1, 0};
    }
    return {0, 0};
}

const char* directionName(Direction d) {
    switch (d) {
        case Direction::Up:    return "up";
        case Direction::Down:  return "down";
        case Direction::Left:  return "left";
        case Direction::Right: return "right";
    }
    return "?";
}

char directionCode(Direction d) {
    switch (d) {
        case Direction::Up:    return 'U';
        case Direction::Down:  return 'D';
        case Direction::Left:  return 'L';
        case Direction::Right: return 'R';
    }
    return '?';
}

std::optional<Direction> parseDirection(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (unsigned char c : s) v.push_back(static_cast<char>(std::tolower(c)));

    if (v == "up" || v == "u") return Direction::Up;
    if (v == "down" || v == "d") return Direction::Down;
    if (v == "left" || v == "l") return Direction::Left;
    if (v == "right" || v == "r") return Direction::Right;
    return std::nullopt;
}

TurnResult stepTurn(GameState& state, Direction dir, RNG& rng) {
    if (state.isOver()) {
        throw std::logic_error("stepTurn called after the run ended");
    }
    if (static_cast<int>(dir) < 0 || static_cast<int>(dir) >= DIRECTION_COUNT) {
        throw std::invalid_argument("stepTurn called with an invalid direction");
    }

    Player& p = state.player;
    Grid& grid = state.grid;

    TurnResult r;
    r.from = p.pos;
    r.to = p.pos;
    r.healthBefore = p.health;

    const Vec2i target = p.pos + directionDelta(dir);
    r.target = target;

    if (!grid.isTraversable(target)) {
        r.tag = TurnTag::Bump;
    } else {
        p.pos = target;
        r.to = target;

        CellKind& cell = grid.at(target);
        r.steppedOn = cell;

        switch (cell) {
            case CellKind::Trap:
                p.health = std::max(0, p.health - 1);
                cell = CellKind::Empty;
                r.tag = TurnTag::Trapped;
                break;
            case CellKind::Medkit:
                p.health = std::min(p.health + 1, p.maxHealth);
                cell = CellKind::Empty;
                r.tag = TurnTag::Healed;
                break;
            case CellKind::Helper:
                p.health = std::min(p.health + 1, p.maxHealth);
                for (Drone& d : state.drones) {
                    d.frozenTurns = state.difficulty.helperFreezeTurns;
                }
                cell = CellKind::Empty;
                r.tag = TurnTag::Helped;
                break;
            case CellKind::Exit:
                r.tag = TurnTag::Victory;
                break;
            case CellKind::Empty:
            case CellKind::Drone:
                r.tag = TurnTag::Moved;
                break;
            case CellKind::Wall:
                // isTraversable() rejected walls above.
                r.tag = TurnTag::Bump;
                break;
        }

        if (r.tag != TurnTag::Victory) {
            advanceDrones(state.drones, grid, rng);

            if (state.droneAt(p.pos)) {
                p.health = 0;
                r.caught = true;
            }
        }

        if (p.health <= 0) {
            r.tag = TurnTag::Defeat;
        }
    }

    state.turn += 1;
    state.lastTag = r.tag;
    if (r.tag == TurnTag::Victory) state.outcome = RunOutcome::Victory;
    if (r.tag == TurnTag::Defeat) state.outcome = RunOutcome::Defeat;

    r.healthAfter = p.health;
    r.turn = state.turn;
    return r;
}
