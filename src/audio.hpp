#pragma once

#include "sdl.hpp"

#include "sfx.hpp"

#include <array>
#include <cstdint>
#include <vector>

// Plays synthesized cues on an SDL audio device via SDL_QueueAudio.
// Clips are rendered on first use and kept in memory.
//
// While a regular cue is still queued, further regular cues are skipped so
// rapid moves do not pile up. End-of-run cues always play: they flush
// whatever is queued first.
class AudioOut {
public:
    AudioOut() = default;
    ~AudioOut();

    AudioOut(const AudioOut&) = delete;
    AudioOut& operator=(const AudioOut&) = delete;

    // Requires SDL_INIT_AUDIO. Returns false (and logs) if no device opens;
    // the game then runs silently.
    bool init(bool enabled);
    void shutdown();

    bool active() const { return device_ != 0 && enabled_; }
    void setEnabled(bool on) { enabled_ = on; }

    void play(SoundCue cue);

private:
    const std::vector<int16_t>& clip(SoundCue cue);

    SDL_AudioDeviceID device_ = 0;
    int sampleRate_ = SFX_SAMPLE_RATE;
    bool enabled_ = true;

    std::array<std::vector<int16_t>, SOUND_CUE_COUNT> clips_;
    std::array<bool, SOUND_CUE_COUNT> built_{};
};
