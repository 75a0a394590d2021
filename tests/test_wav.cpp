#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "rtvoice/audio/wav.hpp"

#include <string>
#include <vector>

using rtvoice::audio::AudioDecodeError;
using rtvoice::audio::decode_chunk;
using rtvoice::audio::encode_wav;

TEST_CASE("headerless PCM is read at the stream rate") {
    const std::string payload(3200, '\0');
    const auto buffer = decode_chunk(payload, 16000, 16000);
    REQUIRE(buffer.samples.size() == 1600);
    REQUIRE(buffer.duration() == Catch::Approx(0.1));
}

TEST_CASE("headerless PCM is resampled to the output rate") {
    const std::string payload(1600, '\0');
    const auto buffer = decode_chunk(payload, 8000, 16000);
    REQUIRE(buffer.sample_rate == 16000);
    REQUIRE(buffer.samples.size() == 1600);
    REQUIRE(buffer.duration() == Catch::Approx(0.1));
}

TEST_CASE("WAVE payload uses the rate from its header") {
    const std::vector<int16_t> samples(2400, 1000);
    const auto wav = encode_wav(samples, 24000);
    const auto buffer = decode_chunk(wav, 16000, 24000);
    REQUIRE(buffer.sample_rate == 24000);
    REQUIRE(buffer.samples.size() == 2400);
    REQUIRE(buffer.samples.front() == 1000);
}

TEST_CASE("stereo WAVE is mixed down to mono") {
    std::vector<int16_t> interleaved;
    for (int i = 0; i < 100; ++i) {
        interleaved.push_back(1000);
        interleaved.push_back(3000);
    }
    const auto wav = encode_wav(interleaved, 16000, 2);
    const auto buffer = decode_chunk(wav, 16000, 16000);
    REQUIRE(buffer.samples.size() == 100);
    REQUIRE(buffer.samples[10] == 2000);
}

TEST_CASE("invalid payloads raise AudioDecodeError") {
    REQUIRE_THROWS_AS(decode_chunk("", 16000, 16000), AudioDecodeError);
    REQUIRE_THROWS_AS(decode_chunk("abc", 16000, 16000), AudioDecodeError);
    REQUIRE_THROWS_AS(decode_chunk(std::string("RIFF\x24\0\0\0JUNK", 12), 16000, 16000),
                      AudioDecodeError);
}
