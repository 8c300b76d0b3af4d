#include "settings.hpp"

#include "narrator.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string trim(std::string s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    const std::string s = trim(v);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long n = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    if (n < -1000000L || n > 1000000L) return false;
    out = static_cast<int>(n);
    return true;
}

std::string stripComment(const std::string& line) {
    const size_t cut = line.find_first_of("#;");
    return cut == std::string::npos ? line : line.substr(0, cut);
}

} // namespace

Settings loadSettings(const std::string& path) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    while (std::getline(f, line)) {
        line = trim(stripComment(line));
        if (line.empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));

        bool b = false;
        int n = 0;

        if (key == "difficulty") {
            if (auto id = parseDifficultyId(val)) s.difficulty = *id;
        } else if (key == "narrator") {
            const std::string k = toLower(val);
            if (findPersona(k)) s.narrator = k;
        } else if (key == "narration") {
            if (parseBool(val, b)) s.narration = b;
        } else if (key == "sound") {
            if (parseBool(val, b)) s.sound = b;
        } else if (key == "color") {
            if (parseBool(val, b)) s.color = b;
        } else if (key == "tile_size") {
            if (parseInt(val, n)) s.tileSize = std::clamp(n, 24, 96);
        } else if (key == "vsync") {
            if (parseBool(val, b)) s.vsync = b;
        } else if (key == "controller_enabled") {
            if (parseBool(val, b)) s.controllerEnabled = b;
        } else if (key == "record_replays") {
            if (parseBool(val, b)) s.recordReplays = b;
        }
    }

    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# Signal Vault settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run. Command-line flags override it.

# Run setup
# difficulty: easy | normal | hard
difficulty = normal
# narrator: dramatic | mentor | humorous | cyberpunk
narrator = mentor
# narration: true/false  (false keeps the message log to plain events)
narration = true

# Audio
sound = true

# Terminal
# color: true/false  (ANSI colors in signalvault_term)
color = true

# Window
# tile_size: 24..96
tile_size = 48
vsync = true
# controller_enabled: true/false  (SDL2 game controller d-pad)
controller_enabled = true

# Replays
# record_replays: true/false  (writes replays/<timestamp>_<seed>.svr for every run)
record_replays = false
)INI";

    return f.good();
}

bool updateIniKey(const std::string& path, const std::string& key, const std::string& value) {
    std::ifstream in(path);
    if (!in) return false;

    const std::string wanted = toLower(key);

    std::vector<std::string> lines;
    std::string line;
    bool found = false;

    while (std::getline(in, line)) {
        const std::string raw = stripComment(line);
        const size_t eq = raw.find('=');
        if (eq != std::string::npos && toLower(trim(raw.substr(0, eq))) == wanted) {
            lines.push_back(key + " = " + value);
            found = true;
            continue;
        }
        lines.push_back(line);
    }
    in.close();

    if (!found) lines.push_back(key + " = " + value);

    std::ofstream out(path, std::ios::trunc);
    if (!out) return false;

    for (const std::string& l : lines) out << l << "\n";
    return out.good();
}
