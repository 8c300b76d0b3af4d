#pragma once

#include "turn.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Procedural sound effects: short 16-bit mono PCM clips built from sine
// segments. Nothing here touches an audio device; see audio.hpp.

enum class SoundCue : uint8_t {
    Trap = 0,
    Medkit,
    Helper,
    Wall,
    DroneHit,
    Victory,
    Defeat,
    Ambient,
};

constexpr int SOUND_CUE_COUNT = 8;

const char* soundCueName(SoundCue c);

constexpr int SFX_SAMPLE_RATE = 44100;

// Cue for a resolved turn. Plain moves have none. Terminal turns win over
// the cell effect, and a catch plays the drone hit.
std::optional<SoundCue> cueForTurn(const TurnResult& r);

// Renders the full clip for a cue at `sampleRate`.
std::vector<int16_t> synthesizeCue(SoundCue cue, int sampleRate = SFX_SAMPLE_RATE);

// One segment of a clip. An empty frequency list is silence. Frequencies are
// averaged; the envelope fades in and out over `fadeSec` with a quarter-sine
// curve. `phase` carries the oscillator phase from one segment to the next
// and is updated on return.
void renderSegment(std::vector<int16_t>& out,
                   const std::vector<double>& freqs,
                   double durationSec,
                   double volume,
                   double& phase,
                   int sampleRate,
                   double fadeSec = 0.02);

// Canonical 44-byte-header PCM WAV writer.
bool writeWavFile(const std::string& path,
                  const std::vector<int16_t>& samples,
                  int sampleRate,
                  std::string* err = nullptr);
