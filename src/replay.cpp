#include "replay.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace {

std::string trimCopy(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v > 0xFFFFFFFFull) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

bool parseHex64(const std::string& s, uint64_t& out) {
    std::string h = s;
    if (h.size() > 2 && h[0] == '0' && (h[1] == 'x' || h[1] == 'X')) h = h.substr(2);
    if (h.empty() || h.size() > 16) return false;

    uint64_t v = 0;
    for (char c : h) {
        int d = -1;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = 10 + (c - 'a');
        else if (c >= 'A' && c <= 'F') d = 10 + (c - 'A');
        if (d < 0) return false;
        v = (v << 4) | static_cast<uint64_t>(d);
    }
    out = v;
    return true;
}

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

std::string lineErr(int lineNo, const std::string& what) {
    return "line " + std::to_string(lineNo) + ": " + what;
}

std::string moveLine(uint32_t turn, Direction d) {
    return std::to_string(turn) + " M " + std::string(1, directionCode(d));
}

std::string hashLine(uint32_t turn, uint64_t hash) {
    return std::to_string(turn) + " H " + formatReplayHash(hash);
}

std::string headerText(const ReplayMeta& meta) {
    std::ostringstream ss;
    ss << "@signalvault_replay " << meta.formatVersion << "\n";
    ss << "@game_version " << meta.gameVersion << "\n";
    ss << "@seed " << meta.seed << "\n";
    ss << "@difficulty " << difficultyPreset(meta.difficulty).key << "\n";
    ss << "@end_header\n";
    return ss.str();
}

} // namespace

size_t ReplayFile::moveCount() const {
    size_t n = 0;
    for (const ReplayEvent& ev : events) {
        if (ev.kind == ReplayEventType::Move) ++n;
    }
    return n;
}

std::string formatReplayHash(uint64_t hash) {
    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return ss.str();
}

bool ReplayWriter::open(const std::filesystem::path& path, const ReplayMeta& meta, std::string* err) {
    close();

    path_ = path;
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    f_.open(path_, std::ios::out | std::ios::trunc);
    if (!f_) {
        setErr(err, "Failed to open replay for writing: " + path_.string());
        return false;
    }

    f_ << headerText(meta);
    f_.flush();
    return true;
}

void ReplayWriter::close() {
    if (f_.is_open()) {
        f_.flush();
        f_.close();
    }
    path_.clear();
}

void ReplayWriter::writeLine_(const std::string& line) {
    if (!f_.is_open()) return;
    f_ << line << "\n";
}

void ReplayWriter::writeMove(uint32_t turn, Direction d) {
    writeLine_(moveLine(turn, d));
}

void ReplayWriter::writeStateHash(uint32_t turn, uint64_t hash) {
    writeLine_(hashLine(turn, hash));
    // Checkpoints are rare enough to flush; a crash keeps everything up to here.
    f_.flush();
}

std::string formatReplay(const ReplayFile& replay) {
    std::string out = headerText(replay.meta);
    for (const ReplayEvent& ev : replay.events) {
        switch (ev.kind) {
            case ReplayEventType::Move:      out += moveLine(ev.turn, ev.dir); break;
            case ReplayEventType::StateHash: out += hashLine(ev.turn, ev.hash); break;
        }
        out += "\n";
    }
    return out;
}

bool parseReplay(std::istream& in, ReplayFile& out, std::string* err) {
    out = ReplayFile{};

    bool inHeader = true;
    bool sawMagic = false;
    bool sawSeed = false;
    bool sawDifficulty = false;

    std::string line;
    int lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        line = trimCopy(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);

        if (inHeader) {
            if (line == "@end_header") {
                if (!sawMagic) {
                    setErr(err, lineErr(lineNo, "missing @signalvault_replay header"));
                    return false;
                }
                if (!sawSeed || !sawDifficulty) {
                    setErr(err, lineErr(lineNo, "header needs @seed and @difficulty"));
                    return false;
                }
                inHeader = false;
                continue;
            }
            if (line[0] != '@') {
                setErr(err, lineErr(lineNo, "expected header @key"));
                return false;
            }

            std::string key;
            iss >> key;
            std::string value;
            std::getline(iss, value);
            value = trimCopy(value);

            if (key == "@signalvault_replay") {
                uint32_t v = 0;
                if (!parseU32(value, v) || v != 1) {
                    setErr(err, lineErr(lineNo, "unsupported format version '" + value + "'"));
                    return false;
                }
                out.meta.formatVersion = static_cast<int>(v);
                sawMagic = true;
            } else if (key == "@game_version") {
                out.meta.gameVersion = value;
            } else if (key == "@seed") {
                if (!parseU32(value, out.meta.seed)) {
                    setErr(err, lineErr(lineNo, "bad seed '" + value + "'"));
                    return false;
                }
                sawSeed = true;
            } else if (key == "@difficulty") {
                auto id = parseDifficultyId(value);
                if (!id) {
                    setErr(err, lineErr(lineNo, "unknown difficulty '" + value + "'"));
                    return false;
                }
                out.meta.difficulty = *id;
                sawDifficulty = true;
            }
            // Unknown header keys are ignored for forward compat.
            continue;
        }

        std::string turnTok;
        std::string code;
        std::string payload;
        std::string extra;
        iss >> turnTok >> code >> payload >> extra;

        ReplayEvent ev;
        if (!parseU32(turnTok, ev.turn)) {
            setErr(err, lineErr(lineNo, "bad turn '" + turnTok + "'"));
            return false;
        }
        if (payload.empty() || !extra.empty()) {
            setErr(err, lineErr(lineNo, "expected '<turn> <code> <value>'"));
            return false;
        }

        if (code == "M") {
            auto d = parseDirection(payload);
            if (!d || payload.size() != 1) {
                setErr(err, lineErr(lineNo, "bad direction '" + payload + "'"));
                return false;
            }
            ev.kind = ReplayEventType::Move;
            ev.dir = *d;
        } else if (code == "H") {
            if (!parseHex64(payload, ev.hash)) {
                setErr(err, lineErr(lineNo, "bad hash '" + payload + "'"));
                return false;
            }
            ev.kind = ReplayEventType::StateHash;
        } else {
            setErr(err, lineErr(lineNo, "unknown event code '" + code + "'"));
            return false;
        }

        out.events.push_back(ev);
    }

    if (inHeader) {
        setErr(err, lineErr(lineNo, "missing @end_header"));
        return false;
    }
    return true;
}

bool loadReplayFile(const std::filesystem::path& path, ReplayFile& out, std::string* err) {
    std::ifstream f(path);
    if (!f) {
        setErr(err, "Failed to open replay for reading: " + path.string());
        return false;
    }

    std::string perr;
    if (!parseReplay(f, out, &perr)) {
        setErr(err, path.string() + ": " + perr);
        return false;
    }
    return true;
}
