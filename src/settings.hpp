#pragma once

#include <string>

#include "difficulty.hpp"

// User-editable settings file (INI-ish: key = value).
// Created in the data directory on first run.
struct Settings {
    // Default run setup; the command line overrides both.
    DifficultyId difficulty = DifficultyId::Normal;
    std::string narrator = "mentor";

    bool narration = true;
    bool sound = true;

    // ANSI colors in the terminal front end.
    bool color = true;

    // SDL front end
    int tileSize = 48; // 24..96
    bool vsync = true;
    bool controllerEnabled = true;

    // Write a replay file for every finished run.
    bool recordReplays = false;
};

// Loads settings from disk. A missing file, unknown keys and invalid values
// all fall back to defaults.
Settings loadSettings(const std::string& path);

// Update (or append) a single key = value entry in the settings file.
// Returns false if the file could not be read/written.
bool updateIniKey(const std::string& path, const std::string& key, const std::string& value);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);
