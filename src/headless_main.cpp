#include "difficulty.hpp"
#include "grid.hpp"
#include "mapgen.hpp"
#include "replay.hpp"
#include "replay_runner.hpp"
#include "rng.hpp"
#include "sfx.hpp"
#include "version.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

namespace {

void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " --replay <file.svr> [options]\n"
        << "  " << argv0 << " --replay-dir <dir> [options]\n"
        << "  " << argv0 << " --mapgen-check <count> [--difficulty e|n|h] [--seed <n>]\n"
        << "  " << argv0 << " --export-sfx <dir>\n\n"
        << "Options:\n"
        << "  --replay <path>         Rebuild one recorded run and check it.\n"
        << "  --replay-dir <path>     Check every .svr file directly inside <path>.\n"
        << "  --stop-after-first-fail With --replay-dir: stop at the first failing file.\n"
        << "  --no-verify-hashes      Apply moves only; ignore recorded state hashes.\n"
        << "  --max-moves <n>         Fail once <n> moves were applied (0 = no cap).\n"
        << "  --json-report <path>    Also write the results as JSON.\n"
        << "  --mapgen-check <count>  Generate <count> maps per difficulty and check them.\n"
        << "  --difficulty <key>      Limit --mapgen-check to a difficulty (repeatable).\n"
        << "  --seed <n>              First seed for --mapgen-check. Default: 1.\n"
        << "  --export-sfx <dir>      Write every sound cue as a WAV file.\n"
        << "  --version, -v           Print the version and exit.\n"
        << "  --help, -h              Show this help and exit.\n"
        << "\nExit status: 0 all checks passed, 1 a check failed, 2 bad usage.\n";
}

bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty() || s[0] == '-') return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v > 0xFFFFFFFFull) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

// Minimal JSON emitter for the CI report: objects, arrays and scalar fields
// with comma bookkeeping. No parsing.
class JsonOut {
public:
    explicit JsonOut(std::ostream& os) : os_(os) {}

    void open(const char* key, char bracket) {
        prefix(key);
        os_ << bracket;
        first_.push_back(true);
    }
    void close(char bracket) {
        first_.pop_back();
        os_ << "\n" << std::string(first_.size() * 2, ' ') << bracket;
    }

    void field(const char* key, const std::string& v) {
        prefix(key);
        quoted(v);
    }
    void field(const char* key, const char* v) { field(key, std::string(v)); }
    void field(const char* key, uint64_t v) {
        prefix(key);
        os_ << v;
    }
    void field(const char* key, bool v) {
        prefix(key);
        os_ << (v ? "true" : "false");
    }

private:
    void prefix(const char* key) {
        if (!first_.empty()) {
            if (!first_.back()) os_ << ",";
            first_.back() = false;
            os_ << "\n" << std::string(first_.size() * 2, ' ');
        }
        if (key) {
            quoted(key);
            os_ << ": ";
        }
    }

    void quoted(const std::string& s) {
        os_ << '"';
        for (unsigned char c : s) {
            if (c == '"' || c == '\\') {
                os_ << '\\' << static_cast<char>(c);
            } else if (c == '\n') {
                os_ << "\\n";
            } else if (c < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                os_ << buf;
            } else {
                os_ << static_cast<char>(c);
            }
        }
        os_ << '"';
    }

    std::ostream& os_;
    std::vector<bool> first_;
};

struct ReplayCheck {
    std::filesystem::path file;
    bool ok = false;
    ReplayRunStats stats;
    std::string error;
};

// Sorted .svr files directly inside `dir`; a single file is returned as-is.
std::vector<std::filesystem::path> collectReplays(const std::filesystem::path& fileOrDir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(fileOrDir, ec)) return {fileOrDir};

    std::vector<std::filesystem::path> files;
    for (std::filesystem::directory_iterator it(fileOrDir, ec), last; !ec && it != last; it.increment(ec)) {
        if (it->path().extension() != ".svr") continue;
        if (it->is_regular_file(ec)) files.push_back(it->path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

ReplayCheck checkReplay(const std::filesystem::path& file, const ReplayRunOptions& opt) {
    ReplayCheck c;
    c.file = file;

    ReplayFile replay;
    if (loadReplayFile(file, replay, &c.error)) {
        c.ok = runReplayHeadless(replay, opt, &c.stats, &c.error);
    } else {
        c.stats.failure = ReplayFailureKind::Parse;
    }
    return c;
}

bool writeReport(const std::filesystem::path& path,
                 const std::vector<ReplayCheck>& checks,
                 const ReplayRunOptions& opt,
                 std::string* err) {
    std::ofstream f(path);
    if (!f) {
        if (err) *err = "Cannot write report " + path.generic_string();
        return false;
    }

    const uint64_t passed = static_cast<uint64_t>(
        std::count_if(checks.begin(), checks.end(), [](const ReplayCheck& c) { return c.ok; }));

    JsonOut j(f);
    j.open(nullptr, '{');
    j.field("tool", "signalvault_headless");
    j.field("version", SIGNALVAULT_VERSION);
    j.field("verify_hashes", opt.verifyHashes);
    j.field("max_moves", static_cast<uint64_t>(opt.maxMoves));
    j.field("total", static_cast<uint64_t>(checks.size()));
    j.field("passed", passed);
    j.field("failed", static_cast<uint64_t>(checks.size()) - passed);

    j.open("replays", '[');
    for (const ReplayCheck& c : checks) {
        j.open(nullptr, '{');
        j.field("file", c.file.generic_string());
        j.field("ok", c.ok);
        j.field("outcome", runOutcomeName(c.stats.outcome));
        j.field("turns", static_cast<uint64_t>(c.stats.turns));
        j.field("moves", static_cast<uint64_t>(c.stats.movesApplied));
        j.field("checkpoints", static_cast<uint64_t>(c.stats.checkpointsVerified));
        j.field("final_hash", formatReplayHash(c.stats.finalHash));
        if (!c.ok) {
            j.field("failure", replayFailureKindName(c.stats.failure));
            j.field("failed_turn", static_cast<uint64_t>(c.stats.failedTurn));
            j.field("error", c.error);
            if (c.stats.failure == ReplayFailureKind::HashMismatch) {
                j.field("expected_hash", formatReplayHash(c.stats.expectedHash));
                j.field("got_hash", formatReplayHash(c.stats.gotHash));
            }
        }
        j.close('}');
    }
    j.close(']');
    j.close('}');
    f << "\n";
    return f.good();
}

int verifyReplays(const std::filesystem::path& target,
                  const ReplayRunOptions& opt,
                  bool stopAfterFirstFail,
                  const std::filesystem::path& reportPath) {
    const std::vector<std::filesystem::path> files = collectReplays(target);
    if (files.empty()) {
        std::cerr << "No .svr replays in " << target.generic_string() << "\n";
        return 2;
    }

    std::vector<ReplayCheck> checks;
    for (const std::filesystem::path& file : files) {
        checks.push_back(checkReplay(file, opt));
        const ReplayCheck& c = checks.back();

        std::cout << (c.ok ? "ok   " : "FAIL ") << file.generic_string()
                  << "  outcome=" << runOutcomeName(c.stats.outcome)
                  << " turns=" << c.stats.turns
                  << " moves=" << c.stats.movesApplied
                  << " checkpoints=" << c.stats.checkpointsVerified << "\n";
        if (!c.ok) {
            std::cout << "     " << replayFailureKindName(c.stats.failure) << ": " << c.error << "\n";
            if (stopAfterFirstFail) break;
        }
    }

    const size_t failed = static_cast<size_t>(
        std::count_if(checks.begin(), checks.end(), [](const ReplayCheck& c) { return !c.ok; }));
    std::cout << checks.size() << " replay(s) checked, " << failed << " failed\n";

    if (!reportPath.empty()) {
        std::string err;
        if (!writeReport(reportPath, checks, opt, &err)) std::cerr << err << "\n";
    }
    return failed == 0 ? 0 : 1;
}

// Checks one generated map beyond what generateMap() already guarantees, so
// a regression in the generator shows up as a failure here.
bool checkMap(const Difficulty& d, const Grid& g, std::string& why) {
    if (g.width != d.width || g.height != d.height) { why = "wrong size"; return false; }
    if (g.at(g.start()) != CellKind::Empty) { why = "start not empty"; return false; }
    if (g.at(g.exit()) != CellKind::Exit || g.count(CellKind::Exit) != 1) { why = "exit misplaced"; return false; }
    if (g.count(CellKind::Wall) != d.wallCount) { why = "wall count"; return false; }
    if (g.count(CellKind::Trap) != d.trapCount) { why = "trap count"; return false; }
    if (g.count(CellKind::Medkit) != d.medkitCount) { why = "medkit count"; return false; }
    if (g.count(CellKind::Drone) != d.droneCount) { why = "drone count"; return false; }
    if (g.count(CellKind::Helper) != d.helperCount) { why = "helper count"; return false; }
    if (!pathExists(g, g.start(), g.exit())) { why = "exit unreachable"; return false; }
    return true;
}

int runMapgenCheck(uint32_t count, uint32_t firstSeed, const std::vector<DifficultyId>& ids) {
    int failures = 0;

    for (DifficultyId id : ids) {
        const Difficulty& d = difficultyPreset(id);

        uint64_t attemptsTotal = 0;
        int attemptsMax = 0;
        uint32_t generated = 0;
        uint32_t genFailed = 0;

        for (uint32_t i = 0; i < count; ++i) {
            const uint32_t seed = firstSeed + i;
            RNG rng(seed);
            Grid g;
            MapGenReport report;
            std::string err;
            if (!generateMap(d, rng, g, MapGenOptions{}, &report, &err)) {
                ++genFailed;
                std::cerr << d.key << " seed " << seed << ": " << mapGenErrorName(report.error)
                          << ": " << err << "\n";
                continue;
            }

            ++generated;
            attemptsTotal += static_cast<uint64_t>(report.attempts);
            attemptsMax = std::max(attemptsMax, report.attempts);

            std::string why;
            if (!checkMap(d, g, why)) {
                ++failures;
                std::cerr << d.key << " seed " << seed << ": " << why << "\n";
            }
        }

        const double avg = generated ? static_cast<double>(attemptsTotal) / generated : 0.0;
        std::cout << d.key << ": maps=" << generated
                  << " gen_failed=" << genFailed
                  << " attempts_avg=" << avg
                  << " attempts_max=" << attemptsMax << "\n";

        // UnsolvableLayout is a legal outcome; a preset that hits it at all is
        // still worth flagging.
        failures += static_cast<int>(genFailed);
    }

    std::cout << (failures == 0 ? "Mapgen check OK\n" : "Mapgen check FAILED\n");
    return failures == 0 ? 0 : 1;
}

int exportSfx(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "Cannot create " << dir.generic_string() << ": " << ec.message() << "\n";
        return 1;
    }

    int failed = 0;
    for (int i = 0; i < SOUND_CUE_COUNT; ++i) {
        const SoundCue cue = static_cast<SoundCue>(i);
        const std::filesystem::path out = dir / (std::string(soundCueName(cue)) + ".wav");
        std::string err;
        if (!writeWavFile(out.string(), synthesizeCue(cue), SFX_SAMPLE_RATE, &err)) {
            std::cerr << err << "\n";
            ++failed;
            continue;
        }
        std::cout << "Wrote " << out.generic_string() << "\n";
    }
    return failed == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    std::filesystem::path replayPath;
    std::filesystem::path replayDir;
    std::filesystem::path jsonReport;
    std::filesystem::path sfxDir;
    bool stopAfterFirstFail = false;
    ReplayRunOptions opt;
    uint32_t mapgenCount = 0;
    uint32_t firstSeed = 1;
    std::vector<DifficultyId> difficulties;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        // Fetches the flag's argument or reports it missing.
        std::string v;
        auto value = [&]() -> bool {
            if (i + 1 >= argc) {
                std::cerr << a << " needs a value\n";
                return false;
            }
            v = argv[++i];
            return true;
        };

        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        if (a == "--version" || a == "-v") {
            std::cout << SIGNALVAULT_APPNAME << " " << SIGNALVAULT_VERSION << "\n";
            return 0;
        }

        if (a == "--stop-after-first-fail") {
            stopAfterFirstFail = true;
        } else if (a == "--no-verify-hashes") {
            opt.verifyHashes = false;
        } else if (a == "--replay" || a == "--replay-dir" || a == "--json-report" || a == "--export-sfx") {
            if (!value()) return 2;
            if (a == "--replay") replayPath = v;
            else if (a == "--replay-dir") replayDir = v;
            else if (a == "--json-report") jsonReport = v;
            else sfxDir = v;
        } else if (a == "--max-moves" || a == "--mapgen-check" || a == "--seed") {
            uint32_t n = 0;
            if (!value()) return 2;
            if (!parseU32(v, n) || (a == "--mapgen-check" && n == 0)) {
                std::cerr << "Invalid " << a << " value: " << v << "\n";
                return 2;
            }
            if (a == "--max-moves") opt.maxMoves = n;
            else if (a == "--mapgen-check") mapgenCount = n;
            else firstSeed = n;
        } else if (a == "--difficulty") {
            if (!value()) return 2;
            const auto id = parseDifficultyId(v);
            if (!id) {
                std::cerr << "Unknown difficulty: " << v << "\n";
                return 2;
            }
            difficulties.push_back(*id);
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    const int modes = (!replayPath.empty() ? 1 : 0) + (!replayDir.empty() ? 1 : 0) +
                      (mapgenCount > 0 ? 1 : 0) + (!sfxDir.empty() ? 1 : 0);
    if (modes != 1) {
        std::cerr << "Specify exactly one of --replay, --replay-dir, --mapgen-check or --export-sfx\n";
        printUsage(argv[0]);
        return 2;
    }

    if (mapgenCount > 0) {
        if (difficulties.empty()) {
            for (int i = 0; i < DIFFICULTY_COUNT; ++i) difficulties.push_back(static_cast<DifficultyId>(i));
        }
        return runMapgenCheck(mapgenCount, firstSeed, difficulties);
    }

    if (!sfxDir.empty()) return exportSfx(sfxDir);

    if (!replayDir.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(replayDir, ec)) {
            std::cerr << "Not a directory: " << replayDir.generic_string() << "\n";
            return 2;
        }
        return verifyReplays(replayDir, opt, stopAfterFirstFail, jsonReport);
    }
    return verifyReplays(replayPath, opt, stopAfterFirstFail, jsonReport);
}
