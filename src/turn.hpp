#pragma once

#include "common.hpp"
#include "game_state.hpp"
#include "grid.hpp"
#include "rng.hpp"

#include <cstdint>
#include <optional>
#include <string>

enum class Direction : uint8_t {
    Up = 0,
    Down,
    Left,
    Right,
};

constexpr int DIRECTION_COUNT = 4;

Vec2i directionDelta(Direction d);
const char* directionName(Direction d);

// Single-letter code used by replay files: U, D, L, R.
char directionCode(Direction d);

// Accepts names ("up") and codes ("U"), case-insensitive.
std::optional<Direction> parseDirection(const std::string& s);

// What one call to stepTurn() did.
struct TurnResult {
    TurnTag tag = TurnTag::None;

    // A drone ended the turn on the player's cell (tag is then Defeat).
    bool caught = false;

    Vec2i from{};
    Vec2i to{};
    // Cell the player tried to enter (differs from `to` on a bump).
    Vec2i target{};
    int healthBefore = 0;
    int healthAfter = 0;

    // Kind of the cell entered this turn, before it was consumed.
    CellKind steppedOn = CellKind::Empty;

    // Turn counter after this turn.
    uint32_t turn = 0;

    bool terminal() const { return isTerminalTag(tag); }
};

// Resolves one turn, in this order:
//   1. bump check (out of bounds / wall): position kept, no drone motion
//   2. move + cell effect (trap, medkit, helper, exit)
//   3. drone motion (skipped on Victory)
//   4. catch check: a drone on the player zeroes health
//   5. health <= 0 becomes Defeat
//   6. turn counter += 1
//
// Throws std::logic_error if the run is already over and
// std::invalid_argument for a direction outside the enum; nothing is
// mutated in either case.
TurnResult stepTurn(GameState& state, Direction dir, RNG& rng);
