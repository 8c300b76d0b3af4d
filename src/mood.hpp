#pragma once

#include "game_state.hpp"

#include <cstdint>
#include <optional>

enum class TensionLevel : uint8_t {
    Low = 0,
    Mid,
    High,
};

const char* tensionLevelName(TensionLevel t);

struct Mood {
    TensionLevel tension = TensionLevel::Low;

    // Discrete event of the last turn, for narrators that react to events
    // separately from the continuous mood. Unset for plain moves.
    std::optional<TurnTag> event;

    // Manhattan distance to the nearest drone (-1 when there are none).
    int nearestDrone = -1;
};

// High:  health <= 1/3 of max, or a drone within 1
// Mid:   health <= 2/3 of max, or a drone within 2
// Low:   otherwise
// A negative distance means "no drones" and never raises tension.
TensionLevel classifyTension(int health, int maxHealth, int nearestDroneDistance);

// Pure function of the state; called once per resolved turn.
Mood classifyMood(const GameState& state);
