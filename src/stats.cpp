#include "stats.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <vector>

#if __has_include(<filesystem>)
    #include <filesystem>
    namespace fs = std::filesystem;
#endif

namespace {

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

std::string trimStr(std::string s) {
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

// Quoted fields and doubled quotes are supported; the stats file only ever
// contains difficulty keys and numbers, but hand-edited files may quote.
void splitCsvLine(const std::string& line, std::vector<std::string>& out) {
    out.clear();
    std::string cur;
    bool inQuotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
                continue;
            }
            cur.push_back(c);
            continue;
        }
        if (c == '"') { inQuotes = true; continue; }
        if (c == ',') {
            out.push_back(trimStr(cur));
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    out.push_back(trimStr(cur));
}

std::string csvEscape(const std::string& field) {
    bool needsQuotes = false;
    for (char c : field) {
        if (c == ',' || c == '"' || c == '\n' || c == '\r') {
            needsQuotes = true;
            break;
        }
    }
    if (!needsQuotes) return field;

    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

bool parseU32(const std::string& s, uint32_t& out) {
    const std::string t = trimStr(s);
    if (t.empty() || t[0] == '-') return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(t.c_str(), &end, 10);
    if (errno != 0 || end == t.c_str() || *end != '\0' || v > 0xFFFFFFFFull) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

bool parseI64(const std::string& s, int64_t& out) {
    const std::string t = trimStr(s);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(t.c_str(), &end, 10);
    if (errno != 0 || end == t.c_str() || *end != '\0') return false;
    out = static_cast<int64_t>(v);
    return true;
}

bool atomicWriteTextFile(const std::string& path, const std::string& contents, std::string* err) {
#if __has_include(<filesystem>)
    std::error_code ec;
    const fs::path p(path);
    const fs::path tmp = p.string() + ".tmp";

    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        ec.clear();
    }

    {
        std::ofstream out(tmp, std::ios::binary);
        if (!out) {
            setErr(err, "cannot open " + tmp.string() + " for writing");
            return false;
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out.good()) {
            setErr(err, "write failed: " + tmp.string());
            return false;
        }
    }

    fs::rename(tmp, p, ec);
    if (ec) {
        std::error_code ec2;
        fs::remove(p, ec2);
        ec.clear();
        fs::rename(tmp, p, ec);
    }
    if (ec) {
        std::error_code ec2;
        fs::remove(tmp, ec2);
        setErr(err, "cannot replace " + path + ": " + ec.message());
        return false;
    }
    return true;
#else
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        setErr(err, "cannot open " + path + " for writing");
        return false;
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!out.good()) {
        setErr(err, "write failed: " + path);
        return false;
    }
    return true;
#endif
}

} // namespace

const char* runResultName(RunResult r) {
    switch (r) {
        case RunResult::Victory: return "victory";
        case RunResult::Defeat:  return "defeat";
        case RunResult::Quit:    return "quit";
    }
    return "unknown";
}

bool StatsStore::load(const std::string& path, std::string* err) {
    stats_.clear();

    std::ifstream in(path);
    if (!in) {
        // No file yet is not an error.
        return true;
    }

    std::unordered_map<std::string, size_t> idx;
    bool headerReady = false;

    auto getCol = [&](const std::vector<std::string>& row, const char* name) -> std::string {
        auto it = idx.find(name);
        if (it == idx.end() || it->second >= row.size()) return {};
        return row[it->second];
    };

    std::string line;
    std::vector<std::string> cols;
    int lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        line = trimStr(std::move(line));
        if (line.empty() || line[0] == '#') continue;

        splitCsvLine(line, cols);

        if (!headerReady) {
            if (toLower(cols[0]) != "difficulty") {
                setErr(err, path + ":" + std::to_string(lineNo) + ": missing header row");
                stats_.clear();
                return false;
            }
            for (size_t i = 0; i < cols.size(); ++i) {
                const std::string name = toLower(cols[i]);
                if (!name.empty() && idx.find(name) == idx.end()) idx[name] = i;
            }
            headerReady = true;
            continue;
        }

        const std::string key = toLower(getCol(cols, "difficulty"));
        if (key.empty()) continue;

        DifficultyStats s;
        uint32_t u = 0;
        int64_t i64 = 0;
        if (parseU32(getCol(cols, "runs"), u)) s.runs = u;
        if (parseU32(getCol(cols, "wins"), u)) s.wins = u;
        if (parseU32(getCol(cols, "defeats"), u)) s.defeats = u;
        if (parseU32(getCol(cols, "quits"), u)) s.quits = u;
        if (parseI64(getCol(cols, "best_turns"), i64) && i64 >= 0) s.bestTurns = i64;
        if (parseU32(getCol(cols, "win_streak"), u)) s.winStreak = u;
        if (parseU32(getCol(cols, "best_streak"), u)) s.bestStreak = u;

        // Keep the counters self-consistent if the file was hand-edited.
        s.wins = std::min(s.wins, s.runs);
        s.bestStreak = std::max(s.bestStreak, s.winStreak);

        stats_[key] = s;
    }

    return true;
}

bool StatsStore::save(const std::string& path, std::string* err) const {
    std::ostringstream out;
    out << "difficulty,runs,wins,defeats,quits,best_turns,win_streak,best_streak\n";
    for (const auto& kv : stats_) {
        const DifficultyStats& s = kv.second;
        out << csvEscape(kv.first) << ','
            << s.runs << ','
            << s.wins << ','
            << s.defeats << ','
            << s.quits << ','
            << s.bestTurns << ','
            << s.winStreak << ','
            << s.bestStreak
            << "\n";
    }
    return atomicWriteTextFile(path, out.str(), err);
}

StatsResult StatsStore::recordRun(const std::string& difficultyKey, uint32_t turns, RunResult result) {
    DifficultyStats& s = stats_[toLower(difficultyKey)];
    StatsResult r;

    s.runs += 1;
    switch (result) {
        case RunResult::Victory:
            s.wins += 1;
            s.winStreak += 1;
            s.bestStreak = std::max(s.bestStreak, s.winStreak);
            if (s.bestTurns < 0 || static_cast<int64_t>(turns) < s.bestTurns) {
                s.bestTurns = static_cast<int64_t>(turns);
                r.newBest = true;
            }
            break;
        case RunResult::Defeat:
            s.defeats += 1;
            s.winStreak = 0;
            break;
        case RunResult::Quit:
            s.quits += 1;
            s.winStreak = 0;
            break;
    }

    r.streak = s.winStreak;
    r.bestStreak = s.bestStreak;
    return r;
}

std::string StatsStore::summaryLine(const std::string& difficultyKey) const {
    DifficultyStats s;
    if (const DifficultyStats* found = find(difficultyKey)) s = *found;

    const uint32_t rate = s.runs > 0 ? static_cast<uint32_t>((100ull * s.wins + s.runs / 2) / s.runs) : 0u;

    std::ostringstream out;
    out << "runs " << s.runs
        << ", wins " << s.wins << " (" << rate << "% rate)"
        << ", best ";
    if (s.bestTurns >= 0) out << s.bestTurns;
    else out << "-";
    out << " turns, streak " << s.winStreak << " (best " << s.bestStreak << ")";
    return out.str();
}

const DifficultyStats* StatsStore::find(const std::string& difficultyKey) const {
    auto it = stats_.find(toLower(difficultyKey));
    if (it == stats_.end()) return nullptr;
    return &it->second;
}
