#include "difficulty.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace {

Difficulty makePreset(DifficultyId id, const char* key, const char* name, const char* blurb,
                      int size, int startHp, int maxHp,
                      int walls, int traps, int medkits, int drones) {
    Difficulty d;
    d.id = id;
    d.key = key;
    d.name = name;
    d.blurb = blurb;
    d.width = size;
    d.height = size;
    d.startHealth = startHp;
    d.maxHealth = maxHp;
    d.wallCount = walls;
    d.trapCount = traps;
    d.medkitCount = medkits;
    d.droneCount = drones;
    d.helperCount = 1;
    d.helperFreezeTurns = 2;
    return d;
}

const std::array<Difficulty, DIFFICULTY_COUNT>& presets() {
    static const std::array<Difficulty, DIFFICULTY_COUNT> table = {
        makePreset(DifficultyId::Easy, "easy", "Easy",
                   "Compact map, extra health, single drone.",
                   7, 6, 6, 7, 5, 5, 1),
        makePreset(DifficultyId::Normal, "normal", "Normal",
                   "Balanced run: two drones, moderate hazards.",
                   9, 4, 5, 11, 8, 3, 2),
        makePreset(DifficultyId::Hard, "hard", "Hard",
                   "Bigger map, more walls and traps, a third drone.",
                   10, 4, 5, 16, 14, 3, 3),
    };
    return table;
}

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

} // namespace

const Difficulty& difficultyPreset(DifficultyId id) {
    const int i = std::clamp(static_cast<int>(id), 0, DIFFICULTY_COUNT - 1);
    return presets()[static_cast<size_t>(i)];
}

std::optional<DifficultyId> parseDifficultyId(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isspace(c)) continue;
        v.push_back(static_cast<char>(std::tolower(c)));
    }
    if (v.empty()) return std::nullopt;

    for (const Difficulty& d : presets()) {
        if (v == d.key || (v.size() == 1 && v[0] == d.key[0])) return d.id;
    }
    return std::nullopt;
}

bool validateDifficulty(const Difficulty& d, std::string* err) {
    if (d.width < 2 || d.height < 2) {
        setErr(err, "grid must be at least 2x2");
        return false;
    }
    if (d.maxHealth < 1) {
        setErr(err, "max health must be at least 1");
        return false;
    }
    if (d.startHealth < 1 || d.startHealth > d.maxHealth) {
        setErr(err, "start health must be within [1, max health]");
        return false;
    }
    if (d.wallCount < 0 || d.trapCount < 0 || d.medkitCount < 0 ||
        d.droneCount < 0 || d.helperCount < 0) {
        setErr(err, "feature counts must not be negative");
        return false;
    }
    if (d.helperFreezeTurns < 0) {
        setErr(err, "helper freeze turns must not be negative");
        return false;
    }

    const long long available = static_cast<long long>(d.width) * d.height - 2;
    if (static_cast<long long>(d.placedCount()) > available) {
        std::ostringstream ss;
        ss << "cannot place " << d.placedCount() << " features in "
           << available << " free cells (" << d.width << "x" << d.height << " grid)";
        setErr(err, ss.str());
        return false;
    }
    return true;
}
