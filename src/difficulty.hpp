#pragma once

#include <cstdint>
#include <optional>
#include <string>

enum class DifficultyId : uint8_t {
    Easy = 0,
    Normal,
    Hard,
};

constexpr int DIFFICULTY_COUNT = 3;

// Immutable run configuration, chosen before a run starts.
struct Difficulty {
    DifficultyId id = DifficultyId::Normal;
    std::string key;   // "easy", "normal", "hard" (settings/CLI/stats token)
    std::string name;  // display name
    std::string blurb;

    int width = 9;
    int height = 9;
    int startHealth = 4;
    int maxHealth = 5;

    int wallCount = 0;
    int trapCount = 0;
    int medkitCount = 0;
    int droneCount = 0;
    int helperCount = 0;

    // Turns every drone stays put after the player reaches a helper.
    int helperFreezeTurns = 2;

    // Everything placed by the generator (start and exit excluded).
    int placedCount() const {
        return wallCount + trapCount + medkitCount + droneCount + helperCount;
    }
};

const Difficulty& difficultyPreset(DifficultyId id);

// Accepts the full key or its first letter, case-insensitive ("n", "Normal").
std::optional<DifficultyId> parseDifficultyId(const std::string& s);

// Checks sizes, health and that all counts fit in the grid minus start and exit.
bool validateDifficulty(const Difficulty& d, std::string* err = nullptr);
