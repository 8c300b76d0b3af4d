#include "difficulty.hpp"
#include "input.hpp"
#include "narrator.hpp"
#include "render_text.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "stats.hpp"
#include "version.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#if defined(_WIN32)
    #include <io.h>
    #define SV_ISATTY _isatty
    #define SV_STDIN_FD 0
#else
    #include <poll.h>
    #include <termios.h>
    #include <unistd.h>
    #define SV_ISATTY isatty
    #define SV_STDIN_FD STDIN_FILENO
#endif

namespace {

void printUsage(const char* exe) {
    std::cout
        << SIGNALVAULT_APPNAME << " " << SIGNALVAULT_VERSION << " (terminal)\n"
        << "Usage: " << (exe ? exe : "signalvault_term") << " [options]\n\n"
        << "Options:\n"
        << "  --difficulty <e|n|h>  Skip the difficulty prompt\n"
        << "  --narrator <key>      dramatic | mentor | humorous | cyberpunk\n"
        << "  --seed <n>            Seed for the first run (later runs derive from it)\n"
        << "  --record <file>       Record the first run as a replay\n"
        << "  --no-color            Disable ANSI colors\n"
        << "  --mute-narration      Event messages only, no narrator lines\n"
        << "  --data-dir <path>     Settings/stats/replay directory\n"
        << "\n"
        << "  --version, -v         Print version and exit\n"
        << "  --help, -h            Show this help and exit\n";
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

std::filesystem::path defaultDataDir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME")) {
        if (*xdg) return std::filesystem::path(xdg) / "signalvault";
    }
    if (const char* home = std::getenv("HOME")) {
        if (*home) return std::filesystem::path(home) / ".local" / "share" / "signalvault";
    }
    return std::filesystem::current_path();
}

uint32_t clockSeed() {
    const uint32_t t = static_cast<uint32_t>(std::time(nullptr));
    const uint32_t c = static_cast<uint32_t>(std::clock());
    return hashCombine(t, c) | 1u;
}

// Puts the terminal into non-canonical, no-echo mode for single-key input
// and restores it on destruction. A no-op when stdin is not a terminal.
class RawTerminal {
public:
    RawTerminal() {
#if !defined(_WIN32)
        if (!SV_ISATTY(SV_STDIN_FD)) return;
        if (tcgetattr(SV_STDIN_FD, &saved_) != 0) return;
        termios raw = saved_;
        raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO));
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        active_ = tcsetattr(SV_STDIN_FD, TCSANOW, &raw) == 0;
#endif
    }

    ~RawTerminal() {
#if !defined(_WIN32)
        if (active_) tcsetattr(SV_STDIN_FD, TCSANOW, &saved_);
#endif
    }

    RawTerminal(const RawTerminal&) = delete;
    RawTerminal& operator=(const RawTerminal&) = delete;

    bool active() const { return active_; }

    // Blocks for one complete key. nullopt on end of input.
    std::optional<InputCommand> readKey() {
#if !defined(_WIN32)
        TermKeyDecoder dec;
        for (;;) {
            unsigned char c = 0;
            const ssize_t n = ::read(SV_STDIN_FD, &c, 1);
            if (n <= 0) return std::nullopt;

            const InputCommand cmd = dec.feed(c);
            if (!dec.pending()) return cmd;

            // Give an escape sequence a moment to arrive; a lone ESC quits.
            pollfd pfd{SV_STDIN_FD, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) return dec.flush();
        }
#else
        return std::nullopt;
#endif
    }

private:
#if !defined(_WIN32)
    termios saved_{};
#endif
    bool active_ = false;
};

std::optional<InputCommand> readCommand(RawTerminal& term) {
    if (term.active()) return term.readKey();

    std::cout << "Move (w/a/s/d or up/down/left/right), q to quit: " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) return std::nullopt;
    return commandFromLine(line);
}

std::string promptLine(const std::string& prompt) {
    std::cout << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) return "q";
    return line;
}

DifficultyId chooseDifficulty(DifficultyId fallback) {
    std::cout << "Choose difficulty:\n";
    for (int i = 0; i < DIFFICULTY_COUNT; ++i) {
        const Difficulty& d = difficultyPreset(static_cast<DifficultyId>(i));
        std::cout << "  [" << d.key[0] << "] " << d.name << ": " << d.blurb << "\n";
    }
    for (;;) {
        const std::string raw = promptLine("Select difficulty (e/n/h, Enter for " +
                                           difficultyPreset(fallback).key + "): ");
        if (raw.empty()) return fallback;
        if (auto id = parseDifficultyId(raw)) return *id;
        std::cout << "Invalid choice. Use e/n/h or type the name.\n";
    }
}

std::string chooseNarrator(const std::string& fallback) {
    const auto& all = personas();
    std::cout << "Choose narrator style:\n";
    for (size_t i = 0; i < all.size(); ++i) {
        std::cout << "  [" << (i + 1) << "] " << all[i].label << " (" << all[i].key << "): "
                  << all[i].style << "\n";
    }
    for (;;) {
        const std::string raw = promptLine("Select narrator (number/key, Enter for " + fallback + "): ");
        if (raw.empty()) return fallback;
        if (findPersona(raw)) return raw;
        char* end = nullptr;
        const long idx = std::strtol(raw.c_str(), &end, 10);
        if (*end == '\0' && idx >= 1 && static_cast<size_t>(idx) <= all.size()) {
            return all[static_cast<size_t>(idx - 1)].key;
        }
        std::cout << "Invalid choice. Use the number or persona key.\n";
    }
}

bool askYesNo(const std::string& prompt) {
    for (;;) {
        std::string raw = promptLine(prompt);
        for (char& c : raw) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (raw == "y" || raw == "yes") return true;
        if (raw == "n" || raw == "no" || raw == "q") return false;
        std::cout << "Please answer y or n.\n";
    }
}

std::filesystem::path autoReplayPath(const std::filesystem::path& dataDir, uint32_t seed, int round) {
    return dataDir / "replays" /
           ("run_" + std::to_string(static_cast<uint64_t>(std::time(nullptr))) + "_" +
            std::to_string(seed) + "_" + std::to_string(round) + ".svr");
}

void draw(const RunSession& run, const TextRenderOptions& opt, bool clear) {
    if (clear) std::cout << ansiClearScreen();
    std::cout << renderBoard(run.state(), run.log(), opt) << std::flush;
}

} // namespace

int main(int argc, char** argv) {
    std::optional<DifficultyId> difficultyArg;
    std::optional<std::string> narratorArg;
    std::optional<uint32_t> seedArg;
    std::filesystem::path recordPath;
    std::filesystem::path dataDir;
    bool noColor = false;
    bool muteNarration = false;

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
        } else if (a == "--record") {
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--record requires a path\n";
                return 2;
            }
            recordPath = v;
        } else if (a == "--data-dir") {
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--data-dir requires a path\n";
                return 2;
            }
            dataDir = v;
        } else if (a == "--no-color") {
            noColor = true;
        } else if (a == "--mute-narration") {
            muteNarration = true;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (dataDir.empty()) dataDir = defaultDataDir();
    {
        std::error_code ec;
        std::filesystem::create_directories(dataDir, ec);
        if (ec) std::cerr << "Cannot create data dir " << dataDir.string() << ": " << ec.message() << "\n";
    }

    const std::string settingsPath = (dataDir / "signalvault_settings.ini").string();
    const std::string statsPath = (dataDir / "signalvault_stats.csv").string();

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

    const bool interactive = SV_ISATTY(SV_STDIN_FD) != 0;

    TextRenderOptions ropt;
    ropt.color = settings.color && !noColor;

    SessionConfig cfg;
    cfg.difficulty = difficultyArg ? *difficultyArg : settings.difficulty;
    cfg.narrator = narratorArg ? *narratorArg : settings.narrator;
    cfg.narration = settings.narration && !muteNarration;
    cfg.seed = seedArg ? *seedArg : clockSeed();

    if (!difficultyArg && interactive) cfg.difficulty = chooseDifficulty(cfg.difficulty);
    if (!narratorArg && interactive) cfg.narrator = chooseNarrator(cfg.narrator);

    int round = 0;
    for (;;) {
        ++round;
        if (round == 1 && !recordPath.empty()) cfg.replayPath = recordPath;
        else if (settings.recordReplays) cfg.replayPath = autoReplayPath(dataDir, cfg.seed, round);
        else cfg.replayPath.clear();

        RunSession run;
        std::string err;
        if (!run.start(cfg, &err)) {
            std::cerr << "Cannot start a run: " << err << "\n";
            return 1;
        }

        {
            RawTerminal term;
            while (!run.over()) {
                draw(run, ropt, interactive);

                const std::optional<InputCommand> cmd = readCommand(term);
                if (!cmd || *cmd == InputCommand::Quit) {
                    run.quit();
                    break;
                }
                if (auto dir = commandDirection(*cmd)) run.move(*dir);
            }
        }

        const StatsResult sr = run.finish(stats);
        draw(run, ropt, interactive);

        std::string err2;
        if (!stats.save(statsPath, &err2)) std::cerr << "Stats not saved: " << err2 << "\n";

        std::cout << "Result: " << runResultName(run.result())
                  << " in " << run.state().turn << " turns (seed " << run.state().seed << ")\n";
        if (sr.newBest) std::cout << "New best for " << run.state().difficulty.name << "!\n";
        std::cout << run.state().difficulty.name << ": " << stats.summaryLine(run.state().difficulty.key) << "\n";
        if (!run.replayPath().empty()) std::cout << "Replay saved: " << run.replayPath().string() << "\n";

        if (!interactive || !askYesNo("Play again? (y/n): ")) break;
        cfg.seed = hashCombine(cfg.seed, tag32("NEXTRUN"));
    }

    return 0;
}
