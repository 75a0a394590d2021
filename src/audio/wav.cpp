#include "rtvoice/audio/wav.hpp"

#include <algorithm>

namespace rtvoice::audio {

namespace {

uint16_t read_u16(const std::string& data, size_t offset) {
    return static_cast<uint16_t>(static_cast<uint8_t>(data[offset]) |
                                 (static_cast<uint8_t>(data[offset + 1]) << 8));
}

uint32_t read_u32(const std::string& data, size_t offset) {
    return static_cast<uint32_t>(static_cast<uint8_t>(data[offset])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 3])) << 24);
}

std::vector<int16_t> read_pcm16(const std::string& data, size_t offset, size_t bytes) {
    std::vector<int16_t> samples(bytes / sizeof(int16_t));
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<int16_t>(read_u16(data, offset + i * 2));
    }
    return samples;
}

std::vector<int16_t> downmix(const std::vector<int16_t>& interleaved, uint16_t channels) {
    if (channels <= 1) {
        return interleaved;
    }
    std::vector<int16_t> mono(interleaved.size() / channels);
    for (size_t frame = 0; frame < mono.size(); ++frame) {
        int32_t sum = 0;
        for (uint16_t ch = 0; ch < channels; ++ch) {
            sum += interleaved[frame * channels + ch];
        }
        mono[frame] = static_cast<int16_t>(sum / channels);
    }
    return mono;
}

AudioBuffer decode_wav(const std::string& payload) {
    if (payload.size() < 12 || payload.compare(8, 4, "WAVE") != 0) {
        throw AudioDecodeError("RIFF payload is not WAVE");
    }
    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    bool have_format = false;

    size_t offset = 12;
    while (offset + 8 <= payload.size()) {
        const auto chunk_id = payload.substr(offset, 4);
        const auto chunk_size = static_cast<size_t>(read_u32(payload, offset + 4));
        const auto body = offset + 8;
        if (chunk_id == "fmt ") {
            if (chunk_size < 16 || body + 16 > payload.size()) {
                throw AudioDecodeError("WAVE fmt chunk truncated");
            }
            format = read_u16(payload, body);
            channels = read_u16(payload, body + 2);
            sample_rate = read_u32(payload, body + 4);
            bits_per_sample = read_u16(payload, body + 14);
            have_format = true;
        } else if (chunk_id == "data") {
            if (!have_format) {
                throw AudioDecodeError("WAVE data chunk before fmt chunk");
            }
            if ((format != 1 && format != 0xFFFE) || bits_per_sample != 16) {
                throw AudioDecodeError("only PCM16 WAVE is supported");
            }
            if (channels == 0 || sample_rate == 0) {
                throw AudioDecodeError("WAVE header has zero channels or rate");
            }
            // Streaming encoders often write a placeholder size; clamp to what arrived.
            const auto available = payload.size() - body;
            const auto data_bytes = std::min(chunk_size, available);
            const auto frame_bytes = static_cast<size_t>(channels) * 2;
            const auto usable = data_bytes - (data_bytes % frame_bytes);
            if (usable == 0) {
                throw AudioDecodeError("WAVE data chunk is empty");
            }
            AudioBuffer buffer;
            buffer.sample_rate = static_cast<int>(sample_rate);
            buffer.samples = downmix(read_pcm16(payload, body, usable), channels);
            return buffer;
        }
        offset = body + chunk_size + (chunk_size % 2);
    }
    throw AudioDecodeError("WAVE payload has no data chunk");
}

}

AudioBuffer decode_chunk(const std::string& payload,
                         int stream_sample_rate,
                         int target_sample_rate) {
    if (payload.empty()) {
        throw AudioDecodeError("empty audio payload");
    }
    if (target_sample_rate <= 0 || stream_sample_rate <= 0) {
        throw AudioDecodeError("invalid sample rate");
    }
    AudioBuffer buffer;
    if (payload.size() >= 4 && payload.compare(0, 4, "RIFF") == 0) {
        buffer = decode_wav(payload);
    } else {
        if (payload.size() % 2 != 0) {
            throw AudioDecodeError("PCM16 payload has odd byte count");
        }
        buffer.sample_rate = stream_sample_rate;
        buffer.samples = read_pcm16(payload, 0, payload.size());
    }
    if (buffer.sample_rate != target_sample_rate) {
        buffer.samples = resample_linear(buffer.samples, buffer.sample_rate, target_sample_rate);
        buffer.sample_rate = target_sample_rate;
    }
    return buffer;
}

std::vector<int16_t> resample_linear(const std::vector<int16_t>& samples,
                                     int from_rate,
                                     int to_rate) {
    if (from_rate == to_rate || samples.empty() || from_rate <= 0 || to_rate <= 0) {
        return samples;
    }
    const auto out_size = static_cast<size_t>(
        (static_cast<uint64_t>(samples.size()) * static_cast<uint64_t>(to_rate)) /
        static_cast<uint64_t>(from_rate));
    std::vector<int16_t> result(out_size);
    const double step = static_cast<double>(from_rate) / static_cast<double>(to_rate);
    for (size_t i = 0; i < out_size; ++i) {
        const double position = static_cast<double>(i) * step;
        const auto index = static_cast<size_t>(position);
        const double frac = position - static_cast<double>(index);
        const int16_t a = samples[std::min(index, samples.size() - 1)];
        const int16_t b = samples[std::min(index + 1, samples.size() - 1)];
        result[i] = static_cast<int16_t>(a + (b - a) * frac);
    }
    return result;
}

std::string encode_wav(const std::vector<int16_t>& samples,
                       int sample_rate,
                       uint16_t channels) {
    const uint16_t bits_per_sample = 16;
    const uint16_t block_align = channels * (bits_per_sample / 8);
    const uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * block_align;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    const uint32_t chunk_size = 36 + data_size;

    std::string result;
    result.reserve(44 + data_size);
    auto append = [&result](const void* data, size_t size) {
        result.append(static_cast<const char*>(data), size);
    };
    auto append_u16 = [&append](uint16_t value) {
        const uint8_t bytes[2] = {
            static_cast<uint8_t>(value & 0xFF),
            static_cast<uint8_t>((value >> 8) & 0xFF)
        };
        append(bytes, sizeof(bytes));
    };
    auto append_u32 = [&append](uint32_t value) {
        const uint8_t bytes[4] = {
            static_cast<uint8_t>(value & 0xFF),
            static_cast<uint8_t>((value >> 8) & 0xFF),
            static_cast<uint8_t>((value >> 16) & 0xFF),
            static_cast<uint8_t>((value >> 24) & 0xFF)
        };
        append(bytes, sizeof(bytes));
    };

    append("RIFF", 4);
    append_u32(chunk_size);
    append("WAVE", 4);
    append("fmt ", 4);
    append_u32(16);
    append_u16(1);
    append_u16(channels);
    append_u32(static_cast<uint32_t>(sample_rate));
    append_u32(byte_rate);
    append_u16(block_align);
    append_u16(bits_per_sample);
    append("data", 4);
    append_u32(data_size);
    for (int16_t sample : samples) {
        append_u16(static_cast<uint16_t>(sample));
    }
    return result;
}

}
