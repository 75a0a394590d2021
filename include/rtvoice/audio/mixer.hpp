#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "rtvoice/audio/output.hpp"

namespace rtvoice {
namespace audio {

// render() runs on the device thread; schedule and stop may come from any thread.
class VoiceMixer : public AudioOutput {
public:
    VoiceMixer(int sample_rate, int stream_sample_rate);

    double now() const override;
    AudioBuffer decode(const std::string& payload) override;
    std::shared_ptr<PlaybackHandle> schedule(AudioBuffer buffer,
                                             double start_time,
                                             EndedCallback on_ended) override;

    std::vector<int16_t> render(size_t samples);
    size_t voice_count() const;
    int sample_rate() const;

private:
    struct Voice {
        std::vector<int16_t> samples;
        int64_t start_sample = 0;
        EndedCallback on_ended;
    };

    struct State {
        std::mutex mutex;
        std::map<uint64_t, Voice> voices;
        int64_t rendered = 0;
        uint64_t next_id = 0;
    };

    class Handle;

    int sample_rate_;
    int stream_sample_rate_;
    std::shared_ptr<State> state_;
};

}
}
