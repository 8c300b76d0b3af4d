#pragma once

#include "sdl.hpp"

#include "input.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Window key bindings, overridable from signalvault_settings.ini:
//   bind_<command> = key[, key, ...]
//
// Each key is a single character (w, q) or a named key (up, escape,
// kp_8, ...). "none" unbinds the command. Modifiers are ignored: the game
// has no chorded commands.

struct CommandHash {
    size_t operator()(InputCommand c) const noexcept { return static_cast<size_t>(c); }
};

class KeyBinds {
public:
    static KeyBinds defaults();
    void loadOverridesFromIni(const std::string& settingsPath);

    InputCommand mapKey(SDL_Keycode key) const;

    // Controller d-pad (and Back/Start for quit).
    static InputCommand mapButton(Uint8 button);

    // command name -> key list, for the help line and logging.
    std::vector<std::pair<std::string, std::string>> describeAll() const;

    static SDL_Keycode parseKeycode(const std::string& keyName);
    static std::vector<SDL_Keycode> parseKeyList(const std::string& value);
    static std::optional<InputCommand> parseCommandName(const std::string& bindKey);

private:
    std::unordered_map<InputCommand, std::vector<SDL_Keycode>, CommandHash> binds;
};
