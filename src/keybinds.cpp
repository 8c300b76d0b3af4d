#include "keybinds.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace {

std::string trim(std::string s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, delim)) out.push_back(cur);
    return out;
}

constexpr InputCommand BINDABLE[] = {
    InputCommand::Up,
    InputCommand::Down,
    InputCommand::Left,
    InputCommand::Right,
    InputCommand::Quit,
};

} // namespace

SDL_Keycode KeyBinds::parseKeycode(const std::string& keyNameIn) {
    const std::string keyName = trim(toLower(keyNameIn));
    if (keyName.empty()) return SDLK_UNKNOWN;

    if (keyName.size() == 1) {
        return static_cast<SDL_Keycode>(static_cast<unsigned char>(keyName[0]));
    }

    if (keyName == "up") return SDLK_UP;
    if (keyName == "down") return SDLK_DOWN;
    if (keyName == "left") return SDLK_LEFT;
    if (keyName == "right") return SDLK_RIGHT;
    if (keyName == "escape" || keyName == "esc") return SDLK_ESCAPE;
    if (keyName == "enter" || keyName == "return") return SDLK_RETURN;
    if (keyName == "space") return SDLK_SPACE;
    if (keyName == "backspace") return SDLK_BACKSPACE;
    if (keyName == "kp_2") return SDLK_KP_2;
    if (keyName == "kp_4") return SDLK_KP_4;
    if (keyName == "kp_6") return SDLK_KP_6;
    if (keyName == "kp_8") return SDLK_KP_8;

    // SDL's own names ("Keypad 8", "Left Shift", ...).
    return SDL_GetKeyFromName(keyNameIn.c_str());
}

std::vector<SDL_Keycode> KeyBinds::parseKeyList(const std::string& valueIn) {
    const std::string value = trim(valueIn);
    const std::string vLow = toLower(value);
    if (value.empty() || vLow == "none" || vLow == "unbound") return {};

    std::vector<SDL_Keycode> out;
    for (const auto& part : split(value, ',')) {
        const SDL_Keycode k = parseKeycode(part);
        if (k != SDLK_UNKNOWN) out.push_back(k);
    }
    return out;
}

std::optional<InputCommand> KeyBinds::parseCommandName(const std::string& bindKeyIn) {
    const std::string key = trim(toLower(bindKeyIn));
    if (key.rfind("bind_", 0) != 0) return std::nullopt;
    const std::string name = key.substr(5);

    for (InputCommand c : BINDABLE) {
        if (name == inputCommandName(c)) return c;
    }
    return std::nullopt;
}

KeyBinds KeyBinds::defaults() {
    KeyBinds kb;

    kb.binds[InputCommand::Up] = {SDLK_w, SDLK_UP, SDLK_KP_8};
    kb.binds[InputCommand::Down] = {SDLK_s, SDLK_DOWN, SDLK_KP_2};
    kb.binds[InputCommand::Left] = {SDLK_a, SDLK_LEFT, SDLK_KP_4};
    kb.binds[InputCommand::Right] = {SDLK_d, SDLK_RIGHT, SDLK_KP_6};
    kb.binds[InputCommand::Quit] = {SDLK_q, SDLK_ESCAPE};

    return kb;
}

void KeyBinds::loadOverridesFromIni(const std::string& settingsPath) {
    std::ifstream in(settingsPath);
    if (!in) return;

    std::string line;
    while (std::getline(in, line)) {
        const auto commentPos = line.find_first_of("#;");
        if (commentPos != std::string::npos) line = line.substr(0, commentPos);

        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const auto cmd = parseCommandName(line.substr(0, eq));
        if (!cmd.has_value()) continue;

        binds[*cmd] = parseKeyList(line.substr(eq + 1));
    }
}

InputCommand KeyBinds::mapKey(SDL_Keycode key) const {
    for (InputCommand c : BINDABLE) {
        auto it = binds.find(c);
        if (it == binds.end()) continue;
        if (std::find(it->second.begin(), it->second.end(), key) != it->second.end()) return c;
    }
    return InputCommand::None;
}

InputCommand KeyBinds::mapButton(Uint8 button) {
    switch (button) {
        case SDL_CONTROLLER_BUTTON_DPAD_UP:    return InputCommand::Up;
        case SDL_CONTROLLER_BUTTON_DPAD_DOWN:  return InputCommand::Down;
        case SDL_CONTROLLER_BUTTON_DPAD_LEFT:  return InputCommand::Left;
        case SDL_CONTROLLER_BUTTON_DPAD_RIGHT: return InputCommand::Right;
        case SDL_CONTROLLER_BUTTON_BACK:       return InputCommand::Quit;
        default: break;
    }
    return InputCommand::None;
}

std::vector<std::pair<std::string, std::string>> KeyBinds::describeAll() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (InputCommand c : BINDABLE) {
        std::string keys;
        auto it = binds.find(c);
        if (it != binds.end()) {
            for (SDL_Keycode k : it->second) {
                if (!keys.empty()) keys += ", ";
                keys += toLower(SDL_GetKeyName(k));
            }
        }
        out.emplace_back(inputCommandName(c), keys.empty() ? "none" : keys);
    }
    return out;
}
