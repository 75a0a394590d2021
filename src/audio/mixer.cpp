#include "rtvoice/audio/mixer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace rtvoice::audio {

class VoiceMixer::Handle : public PlaybackHandle {
public:
    Handle(std::weak_ptr<State> state, uint64_t id) : state_(std::move(state)), id_(id) {}

    void stop() override {
        auto state = state_.lock();
        if (!state) {
            throw PlaybackError("audio output closed");
        }
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->voices.erase(id_) == 0) {
            throw PlaybackError("voice already finished");
        }
    }

private:
    std::weak_ptr<State> state_;
    uint64_t id_;
};

VoiceMixer::VoiceMixer(int sample_rate, int stream_sample_rate)
    : sample_rate_(sample_rate),
      stream_sample_rate_(stream_sample_rate),
      state_(std::make_shared<State>()) {}

double VoiceMixer::now() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return static_cast<double>(state_->rendered) / static_cast<double>(sample_rate_);
}

AudioBuffer VoiceMixer::decode(const std::string& payload) {
    return decode_chunk(payload, stream_sample_rate_, sample_rate_);
}

std::shared_ptr<PlaybackHandle> VoiceMixer::schedule(AudioBuffer buffer,
                                                     double start_time,
                                                     EndedCallback on_ended) {
    if (buffer.sample_rate != sample_rate_) {
        buffer.samples = resample_linear(buffer.samples, buffer.sample_rate, sample_rate_);
        buffer.sample_rate = sample_rate_;
    }
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        id = state_->next_id++;
        const auto start_sample = static_cast<int64_t>(
            std::llround(start_time * static_cast<double>(sample_rate_)));
        Voice voice;
        voice.samples = std::move(buffer.samples);
        voice.start_sample = std::max(start_sample, state_->rendered);
        voice.on_ended = std::move(on_ended);
        state_->voices.emplace(id, std::move(voice));
    }
    return std::make_shared<Handle>(state_, id);
}

std::vector<int16_t> VoiceMixer::render(size_t samples) {
    std::vector<int32_t> mix(samples, 0);
    std::vector<EndedCallback> finished;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        const int64_t frame_start = state_->rendered;
        const int64_t frame_end = frame_start + static_cast<int64_t>(samples);
        for (auto it = state_->voices.begin(); it != state_->voices.end();) {
            auto& voice = it->second;
            const int64_t voice_end =
                voice.start_sample + static_cast<int64_t>(voice.samples.size());
            const int64_t from = std::max(frame_start, voice.start_sample);
            const int64_t to = std::min(frame_end, voice_end);
            for (int64_t t = from; t < to; ++t) {
                mix[static_cast<size_t>(t - frame_start)] +=
                    voice.samples[static_cast<size_t>(t - voice.start_sample)];
            }
            if (voice_end <= frame_end) {
                if (voice.on_ended) {
                    finished.push_back(std::move(voice.on_ended));
                }
                it = state_->voices.erase(it);
            } else {
                ++it;
            }
        }
        state_->rendered = frame_end;
    }

    std::vector<int16_t> out(samples);
    for (size_t i = 0; i < samples; ++i) {
        out[i] = static_cast<int16_t>(std::clamp<int32_t>(
            mix[i], std::numeric_limits<int16_t>::min(), std::numeric_limits<int16_t>::max()));
    }
    for (auto& callback : finished) {
        callback();
    }
    return out;
}

size_t VoiceMixer::voice_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->voices.size();
}

int VoiceMixer::sample_rate() const {
    return sample_rate_;
}

}
