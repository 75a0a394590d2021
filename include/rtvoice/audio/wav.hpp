#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace rtvoice {
namespace audio {

class AudioDecodeError : public std::runtime_error {
public:
    explicit AudioDecodeError(const std::string& message) : std::runtime_error(message) {}
};

struct AudioBuffer {
    std::vector<int16_t> samples;
    int sample_rate = 16000;

    double duration() const {
        if (sample_rate <= 0) {
            return 0.0;
        }
        return static_cast<double>(samples.size()) / static_cast<double>(sample_rate);
    }
};

AudioBuffer decode_chunk(const std::string& payload,
                         int stream_sample_rate,
                         int target_sample_rate);

std::vector<int16_t> resample_linear(const std::vector<int16_t>& samples,
                                     int from_rate,
                                     int to_rate);

std::string encode_wav(const std::vector<int16_t>& samples,
                       int sample_rate,
                       uint16_t channels = 1);

}
}
