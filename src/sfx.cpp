#include "sfx.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

namespace {

constexpr double PI = 3.14159265358979323846;

// Headroom so averaged sines never clip.
constexpr double HEADROOM = 0.8;

struct Segment {
    std::vector<double> freqs;
    double duration;
    double volume;
};

std::vector<Segment> cueSegments(SoundCue cue) {
    switch (cue) {
        case SoundCue::Trap:     return {{{90}, 0.12, 0.28}, {{60}, 0.09, 0.24}};
        case SoundCue::Medkit:   return {{{480}, 0.10, 0.24}, {{640}, 0.10, 0.22}};
        case SoundCue::Helper:   return {{{420, 620}, 0.16, 0.20}};
        case SoundCue::Wall:     return {{{80}, 0.08, 0.20}, {{60}, 0.06, 0.16}};
        case SoundCue::DroneHit: return {{{220}, 0.12, 0.26}, {{180}, 0.14, 0.24}};
        case SoundCue::Victory:
            return {{{320}, 0.12, 0.22}, {{}, 0.02, 0.0}, {{520}, 0.14, 0.24}, {{720}, 0.15, 0.22}};
        case SoundCue::Defeat:   return {{{160}, 0.16, 0.24}, {{120}, 0.18, 0.22}};
        case SoundCue::Ambient:
            return {{{110, 220}, 0.9, 0.12}, {{}, 0.08, 0.0}, {{180, 360}, 0.7, 0.10}, {{140}, 0.6, 0.08}};
    }
    return {};
}

void putLE16(std::ofstream& f, uint16_t v) {
    const char b[2] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF)};
    f.write(b, 2);
}

void putLE32(std::ofstream& f, uint32_t v) {
    const char b[4] = {
        static_cast<char>(v & 0xFF),
        static_cast<char>((v >> 8) & 0xFF),
        static_cast<char>((v >> 16) & 0xFF),
        static_cast<char>((v >> 24) & 0xFF),
    };
    f.write(b, 4);
}

} // namespace

const char* soundCueName(SoundCue c) {
    switch (c) {
        case SoundCue::Trap:     return "trap";
        case SoundCue::Medkit:   return "medkit";
        case SoundCue::Helper:   return "helper";
        case SoundCue::Wall:     return "wall";
        case SoundCue::DroneHit: return "drone_hit";
        case SoundCue::Victory:  return "victory";
        case SoundCue::Defeat:   return "defeat";
        case SoundCue::Ambient:  return "ambient";
    }
    return "unknown";
}

std::optional<SoundCue> cueForTurn(const TurnResult& r) {
    switch (r.tag) {
        case TurnTag::Victory: return SoundCue::Victory;
        case TurnTag::Defeat:  return r.caught ? SoundCue::DroneHit : SoundCue::Defeat;
        case TurnTag::Bump:    return SoundCue::Wall;
        case TurnTag::Trapped: return SoundCue::Trap;
        case TurnTag::Healed:  return SoundCue::Medkit;
        case TurnTag::Helped:  return SoundCue::Helper;
        case TurnTag::Moved:
        case TurnTag::None:
            break;
    }
    return std::nullopt;
}

void renderSegment(std::vector<int16_t>& out,
                   const std::vector<double>& freqs,
                   double durationSec,
                   double volume,
                   double& phase,
                   int sampleRate,
                   double fadeSec) {
    const int frames = static_cast<int>(sampleRate * durationSec);
    if (frames <= 0) return;

    if (freqs.empty()) {
        out.insert(out.end(), static_cast<size_t>(frames), int16_t{0});
        return;
    }

    const int fadeFrames = std::max(1, static_cast<int>(sampleRate * fadeSec));
    out.reserve(out.size() + static_cast<size_t>(frames));

    for (int i = 0; i < frames; ++i) {
        const double t = static_cast<double>(i) / sampleRate;

        double s = 0.0;
        for (double f : freqs) s += std::sin(2.0 * PI * f * t + phase);
        s /= static_cast<double>(freqs.size());

        double env = 1.0;
        if (i < fadeFrames) {
            env = std::sin((static_cast<double>(i) / fadeFrames) * PI / 2.0);
        } else if (frames - i < fadeFrames) {
            env = std::sin((static_cast<double>(frames - i) / fadeFrames) * PI / 2.0);
        }

        const double v = std::clamp(s * env * volume * HEADROOM, -1.0, 1.0);
        out.push_back(static_cast<int16_t>(v * 32767.0));
    }

    // Continue the first oscillator where this segment stopped.
    const double endT = static_cast<double>(frames) / sampleRate;
    phase = std::fmod(2.0 * PI * freqs.front() * endT + phase, 2.0 * PI);
}

std::vector<int16_t> synthesizeCue(SoundCue cue, int sampleRate) {
    std::vector<int16_t> out;
    if (sampleRate <= 0) return out;

    double phase = 0.0;
    for (const Segment& seg : cueSegments(cue)) {
        renderSegment(out, seg.freqs, seg.duration, seg.volume, phase, sampleRate);
    }
    return out;
}

bool writeWavFile(const std::string& path,
                  const std::vector<int16_t>& samples,
                  int sampleRate,
                  std::string* err) {
    std::ofstream f(path, std::ios::binary);
    if (!f) {
        if (err) *err = "cannot open " + path + " for writing";
        return false;
    }

    const uint32_t dataBytes = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    const uint16_t channels = 1;
    const uint16_t bits = 16;
    const uint32_t byteRate = static_cast<uint32_t>(sampleRate) * channels * (bits / 8);

    f.write("RIFF", 4);
    putLE32(f, 36u + dataBytes);
    f.write("WAVE", 4);
    f.write("fmt ", 4);
    putLE32(f, 16u);
    putLE16(f, 1u); // PCM
    putLE16(f, channels);
    putLE32(f, static_cast<uint32_t>(sampleRate));
    putLE32(f, byteRate);
    putLE16(f, static_cast<uint16_t>(channels * (bits / 8)));
    putLE16(f, bits);
    f.write("data", 4);
    putLE32(f, dataBytes);
    for (int16_t s : samples) putLE16(f, static_cast<uint16_t>(s));

    if (!f.good()) {
        if (err) *err = "write failed: " + path;
        return false;
    }
    return true;
}
