#include "sdl.hpp"

#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include "audio.hpp"
#include "difficulty.hpp"
#include "keybinds.hpp"
#include "narrator.hpp"
#include "render.hpp"
#include "rng.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "stats.hpp"
#include "version.hpp"

namespace {

void printUsage(const char* exe) {
    std::cout
        << SIGNALVAULT_APPNAME << " " << SIGNALVAULT_VERSION << "\n"
        << "Usage: " << (exe ? exe : "signalvault") << " [options]\n\n"
        << "Options:\n"
        << "  --difficulty <e|n|h>  Difficulty (default: from settings)\n"
        << "  --narrator <key>      dramatic | mentor | humorous | cyberpunk\n"
        << "  --seed <n>            Seed for the first run (later runs derive from it)\n"
        << "  --data-dir <path>     Settings/stats/replay directory\n"
        << "  --mute                Start with sound off\n"
        << "\n"
        << "  --version, -v         Print version and exit\n"
        << "  --help, -h            Show this help and exit\n"
        << "\n"
        << "In game: WASD / arrows / d-pad move, Q / Esc quits the run,\n"
        << "Enter or N starts a new run once it is over, F11 toggles fullscreen,\n"
        << "M toggles sound.\n";
}

bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

std::optional<uint32_t> parseSeed(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s.c_str(), &end, 0);
    if (*end != '\0' || v > 0xFFFFFFFFull) return std::nullopt;
    return static_cast<uint32_t>(v);
}

std::string endBanner(const RunSession& run) {
    switch (run.result()) {
        case RunResult::Victory: return "VICTORY - ENTER: NEW RUN  ESC: EXIT";
        case RunResult::Defeat:  return "GAME OVER - ENTER: NEW RUN  ESC: EXIT";
        case RunResult::Quit:    return "RUN ABORTED - ENTER: NEW RUN  ESC: EXIT";
    }
    return {};
}

} // namespace

int main(int argc, char** argv) {
    std::optional<DifficultyId> difficultyArg;
    std::optional<std::string> narratorArg;
    std::optional<uint32_t> seedArg;
    std::filesystem::path dataDirArg;
    bool muteArg = false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        std::string v;
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << SIGNALVAULT_APPNAME << " " << SIGNALVAULT_VERSION << "\n";
            return 0;
        } else if (a == "--difficulty") {
            if (!argValue(i, argc, argv, v) || !(difficultyArg = parseDifficultyId(v))) {
                std::cerr << "Invalid --difficulty (use e|n|h or easy|normal|hard)\n";
                return 2;
            }
        } else if (a == "--narrator") {
            if (!argValue(i, argc, argv, v) || !findPersona(v)) {
                std::cerr << "Invalid --narrator (use dramatic|mentor|humorous|cyberpunk)\n";
                return 2;
            }
            narratorArg = v;
        } else if (a == "--seed") {
            if (!argValue(i, argc, argv, v) || !(seedArg = parseSeed(v))) {
                std::cerr << "Invalid --seed\n";
                return 2;
            }
        } else if (a == "--data-dir") {
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--data-dir requires a path\n";
                return 2;
            }
            dataDirArg = v;
        } else if (a == "--mute") {
            muteArg = true;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_GAMECONTROLLER | SDL_INIT_AUDIO) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    // Settings, stats and replays live in a per-user writable directory
    // unless --data-dir says otherwise.
    std::filesystem::path baseDir = dataDirArg;
    if (baseDir.empty()) {
        if (char* p = SDL_GetPrefPath("signalvault", SIGNALVAULT_APPNAME)) {
            baseDir = std::filesystem::path(p);
            SDL_free(p);
        } else {
            baseDir = std::filesystem::current_path();
        }
    }
    {
        std::error_code ec;
        std::filesystem::create_directories(baseDir, ec);
        if (ec) std::cerr << "Cannot create data dir " << baseDir.string() << ": " << ec.message() << "\n";
    }

    const std::string settingsPath = (baseDir / "signalvault_settings.ini").string();
    const std::string statsPath = (baseDir / "signalvault_stats.csv").string();

    {
        std::error_code ec;
        if (!std::filesystem::exists(settingsPath, ec)) {
            if (!writeDefaultSettings(settingsPath)) {
                std::cerr << "Failed to write default settings: " << settingsPath << "\n";
            }
        }
    }
    const Settings settings = loadSettings(settingsPath);

    StatsStore stats;
    {
        std::string err;
        if (!stats.load(statsPath, &err)) std::cerr << "Stats not loaded: " << err << "\n";
    }

    KeyBinds binds = KeyBinds::defaults();
    binds.loadOverridesFromIni(settingsPath);
    std::cout << "Key bindings (" << settingsPath << "):\n";
    for (const auto& [command, keys] : binds.describeAll()) {
        std::cout << "  " << command << ": " << keys << "\n";
    }

    SessionConfig cfg;
    cfg.difficulty = difficultyArg ? *difficultyArg : settings.difficulty;
    cfg.narrator = narratorArg ? *narratorArg : settings.narrator;
    cfg.narration = settings.narration;
    cfg.seed = seedArg ? *seedArg
                       : hashCombine(static_cast<uint32_t>(std::time(nullptr)), SDL_GetTicks()) | 1u;

    const Difficulty& diff = difficultyPreset(cfg.difficulty);
    Renderer renderer(diff.width, diff.height, settings.tileSize, settings.vsync);
    if (!renderer.init()) {
        SDL_Quit();
        return 1;
    }

    AudioOut audio;
    if (!audio.init(settings.sound && !muteArg)) std::cout << "Running without sound.\n";

    SDL_GameController* controller = nullptr;
    SDL_JoystickID controllerId = -1;

    auto closeController = [&]() {
        if (controller) {
            SDL_GameControllerClose(controller);
            controller = nullptr;
            controllerId = -1;
        }
    };

    auto openFirstController = [&]() {
        if (!settings.controllerEnabled || controller) return;

        const int n = SDL_NumJoysticks();
        for (int i = 0; i < n; ++i) {
            if (!SDL_IsGameController(i)) continue;
            controller = SDL_GameControllerOpen(i);
            if (controller) {
                SDL_Joystick* joy = SDL_GameControllerGetJoystick(controller);
                controllerId = joy ? SDL_JoystickInstanceID(joy) : -1;
                const char* name = SDL_GameControllerName(controller);
                std::cout << "Controller connected: " << (name ? name : "(unknown)") << "\n";
                break;
            }
        }
    };
    openFirstController();

    int round = 0;
    RunSession run;
    bool recorded = false;

    auto startRun = [&]() -> bool {
        ++round;
        if (settings.recordReplays) {
            cfg.replayPath = baseDir / "replays" /
                             ("run_" + std::to_string(static_cast<uint64_t>(std::time(nullptr))) + "_" +
                              std::to_string(cfg.seed) + "_" + std::to_string(round) + ".svr");
        } else {
            cfg.replayPath.clear();
        }

        std::string err;
        if (!run.start(cfg, &err)) {
            std::cerr << "Cannot start a run: " << err << "\n";
            return false;
        }
        recorded = false;
        std::cout << "Run " << round << ": " << run.state().difficulty.name << ", seed " << run.state().seed << "\n";
        return true;
    };

    auto finishRun = [&]() {
        if (recorded) return;
        recorded = true;

        const StatsResult sr = run.finish(stats);
        std::string err;
        if (!stats.save(statsPath, &err)) std::cerr << "Stats not saved: " << err << "\n";

        std::cout << runResultName(run.result()) << " after " << run.state().turn << " turns"
                  << (sr.newBest ? " (new best)" : "") << "\n"
                  << run.state().difficulty.name << ": " << stats.summaryLine(run.state().difficulty.key) << "\n";
        if (!run.replayPath().empty()) std::cout << "Replay: " << run.replayPath().string() << "\n";
    };

    auto playLastCue = [&]() {
        if (auto cue = run.lastCue()) audio.play(*cue);
    };

    auto handleCommand = [&](InputCommand cmd) {
        if (run.over()) return;
        if (cmd == InputCommand::Quit) {
            run.quit();
        } else if (auto d = commandDirection(cmd)) {
            run.move(*d);
        } else {
            return;
        }
        playLastCue();
        if (run.over()) finishRun();
    };

    auto nextRun = [&]() -> bool {
        cfg.seed = hashCombine(cfg.seed, tag32("NEXTRUN"));
        return startRun();
    };

    if (!startRun()) {
        closeController();
        audio.shutdown();
        renderer.shutdown();
        SDL_Quit();
        return 1;
    }
    playLastCue();

    bool running = true;
    while (running) {
        SDL_Event ev;
        if (!SDL_WaitEventTimeout(&ev, 100)) {
            renderer.render(run, run.over() ? endBanner(run) : std::string());
            continue;
        }

        do {
            switch (ev.type) {
                case SDL_QUIT:
                    running = false;
                    break;

                case SDL_CONTROLLERDEVICEADDED:
                    openFirstController();
                    break;

                case SDL_CONTROLLERDEVICEREMOVED:
                    if (controller && controllerId == static_cast<SDL_JoystickID>(ev.cdevice.which)) {
                        std::cout << "Controller disconnected\n";
                        closeController();
                    }
                    break;

                case SDL_CONTROLLERBUTTONDOWN: {
                    if (!settings.controllerEnabled) break;
                    const Uint8 button = ev.cbutton.button;
                    if (run.over()) {
                        if (button == SDL_CONTROLLER_BUTTON_A || button == SDL_CONTROLLER_BUTTON_START) {
                            if (!nextRun()) running = false;
                            else playLastCue();
                        } else if (button == SDL_CONTROLLER_BUTTON_BACK) {
                            running = false;
                        }
                        break;
                    }
                    handleCommand(KeyBinds::mapButton(button));
                    break;
                }

                case SDL_KEYDOWN: {
                    const SDL_Keycode key = ev.key.keysym.sym;
                    if (key == SDLK_F11) {
                        renderer.toggleFullscreen();
                        break;
                    }
                    if (key == SDLK_m && ev.key.repeat == 0) {
                        audio.setEnabled(!audio.active());
                        break;
                    }
                    if (run.over()) {
                        if (key == SDLK_RETURN || key == SDLK_KP_ENTER || key == SDLK_n) {
                            if (!nextRun()) running = false;
                            else playLastCue();
                        } else if (key == SDLK_ESCAPE || key == SDLK_q) {
                            running = false;
                        }
                        break;
                    }
                    handleCommand(binds.mapKey(key));
                    break;
                }

                default:
                    break;
            }
        } while (running && SDL_PollEvent(&ev));

        if (!running) break;
        renderer.render(run, run.over() ? endBanner(run) : std::string());
    }

    // Closing the window mid-run counts as quitting it.
    if (run.started() && !run.over()) {
        run.quit();
        finishRun();
    }

    closeController();
    audio.shutdown();
    renderer.shutdown();
    SDL_Quit();
    return 0;
}
