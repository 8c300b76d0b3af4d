#pragma once

#include "game_state.hpp"
#include "mood.hpp"
#include "rng.hpp"
#include "turn.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Offline, persona-driven narration. Lines are picked from fixed tables and
// filled from a small set of {placeholders}; nothing here touches GameState
// except through const references.

enum class NarrationEvent : uint8_t {
    Start = 0,
    Status,
    LowHealth,
    Trap,
    Medkit,
    Helper,
    NearMiss,
    Wall,
    DroneHit,
    Quit,
    Victory,
    Defeat,
    Record,
    Streak,
};

constexpr int NARRATION_EVENT_COUNT = 14;

const char* narrationEventKey(NarrationEvent e);

struct Persona {
    std::string key;
    std::string label;
    std::string style;
    std::array<std::vector<std::string>, NARRATION_EVENT_COUNT> events;
    std::array<std::vector<std::string>, 3> tension; // indexed by TensionLevel
};

const std::vector<Persona>& personas();

// nullptr for unknown keys.
const Persona* findPersona(const std::string& key);

struct NarrationContext {
    int health = 0;
    int maxHealth = 0;
    int proximity = -1; // -1: no drones
    TensionLevel tension = TensionLevel::Low;
    uint32_t turns = 0;
    int streak = 0;
};

// Replaces {health} {max_health} {proximity} {turns} {streak}.
// Unknown placeholders are left as-is.
std::string fillTemplate(const std::string& tmpl, const NarrationContext& ctx);

class Narrator {
public:
    Narrator(const Persona& persona, uint32_t seed, bool enabled = true);

    const Persona& persona() const { return *persona_; }
    bool enabled() const { return enabled_; }
    void setEnabled(bool on) { enabled_ = on; }

    // Clears per-run memory (low-health note, status cooldown).
    void resetRound();

    // One base line for the event plus one tension line. Empty when disabled
    // or when the persona has no line for the event.
    std::string describe(NarrationEvent ev, const NarrationContext& ctx);

    // All lines for a resolved turn, in display order.
    std::vector<std::string> narrateTurn(const TurnResult& r, const Mood& mood, const GameState& s);

    // Occasional atmosphere: fires when 3 turns passed since the last status
    // line or when tension rises to Mid/High. Empty otherwise.
    std::string ambientStatus(const Mood& mood, const GameState& s);

    bool lowHealthNoted() const { return lowHealthNoted_; }

private:
    const Persona* persona_;
    RNG rng_;
    bool enabled_ = true;
    bool lowHealthNoted_ = false;
    int64_t lastStatusTurn_ = -10;
    TensionLevel lastTension_ = TensionLevel::Low;
};

NarrationContext narrationContext(const GameState& s, const Mood& mood);
