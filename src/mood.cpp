#include "mood.hpp"

const char* tensionLevelName(TensionLevel t) {
    switch (t) {
        case TensionLevel::Low:  return "low";
        case TensionLevel::Mid:  return "mid";
        case TensionLevel::High: return "high";
    }
    return "low";
}

TensionLevel classifyTension(int health, int maxHealth, int nearestDroneDistance) {
    const bool hasDrone = nearestDroneDistance >= 0;

    // Integer form of health/maxHealth <= 1/3 (resp. 2/3).
    if (maxHealth > 0) {
        if (3 * health <= maxHealth) return TensionLevel::High;
    }
    if (hasDrone && nearestDroneDistance <= 1) return TensionLevel::High;

    if (maxHealth > 0) {
        if (3 * health <= 2 * maxHealth) return TensionLevel::Mid;
    }
    if (hasDrone && nearestDroneDistance <= 2) return TensionLevel::Mid;

    return TensionLevel::Low;
}

Mood classifyMood(const GameState& state) {
    Mood m;
    m.nearestDrone = state.nearestDroneDistance();
    m.tension = classifyTension(state.player.health, state.player.maxHealth, m.nearestDrone);

    switch (state.lastTag) {
        case TurnTag::None:
        case TurnTag::Moved:
            break;
        case TurnTag::Bump:
        case TurnTag::Trapped:
        case TurnTag::Healed:
        case TurnTag::Helped:
        case TurnTag::Victory:
        case TurnTag::Defeat:
            m.event = state.lastTag;
            break;
    }
    return m;
}
