#include "audio.hpp"

#include <iostream>

AudioOut::~AudioOut() {
    shutdown();
}

bool AudioOut::init(bool enabled) {
    enabled_ = enabled;
    if (device_ != 0) return true;

    SDL_AudioSpec want{};
    SDL_AudioSpec have{};
    want.freq = SFX_SAMPLE_RATE;
    want.format = AUDIO_S16SYS;
    want.channels = 1;
    want.samples = 1024;
    want.callback = nullptr; // push mode (SDL_QueueAudio)

    device_ = SDL_OpenAudioDevice(nullptr, 0, &want, &have, SDL_AUDIO_ALLOW_FREQUENCY_CHANGE);
    if (device_ == 0) {
        std::cerr << "Audio disabled: SDL_OpenAudioDevice failed: " << SDL_GetError() << "\n";
        return false;
    }

    sampleRate_ = have.freq;
    SDL_PauseAudioDevice(device_, 0);
    return true;
}

void AudioOut::shutdown() {
    if (device_ != 0) {
        SDL_CloseAudioDevice(device_);
        device_ = 0;
    }
}

const std::vector<int16_t>& AudioOut::clip(SoundCue cue) {
    const size_t i = static_cast<size_t>(cue);
    if (!built_[i]) {
        clips_[i] = synthesizeCue(cue, sampleRate_);
        built_[i] = true;
    }
    return clips_[i];
}

void AudioOut::play(SoundCue cue) {
    if (!active()) return;

    const bool important = cue == SoundCue::Victory || cue == SoundCue::Defeat || cue == SoundCue::DroneHit;
    if (important) {
        SDL_ClearQueuedAudio(device_);
    } else if (SDL_GetQueuedAudioSize(device_) > 0) {
        return;
    }

    const std::vector<int16_t>& pcm = clip(cue);
    if (pcm.empty()) return;

    const Uint32 bytes = static_cast<Uint32>(pcm.size() * sizeof(int16_t));
    if (SDL_QueueAudio(device_, pcm.data(), bytes) != 0) {
        std::cerr << "SDL_QueueAudio failed: " << SDL_GetError() << "\n";
    }
}
