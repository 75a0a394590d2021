#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "rtvoice/audio/output.hpp"
#include "rtvoice/backend/channel.hpp"
#include "rtvoice/recognition/recognizer.hpp"

namespace rtvoice::testing {

// Headerless PCM16 of the given length at 16 kHz.
inline std::string pcm_chunk(double seconds, int sample_rate = 16000) {
    const auto samples = static_cast<size_t>(seconds * sample_rate);
    return std::string(samples * 2, '\x01');
}

class FakeHandle : public audio::PlaybackHandle {
public:
    void stop() override {
        if (finished) {
            throw audio::PlaybackError("already finished");
        }
        stopped = true;
    }

    bool stopped = false;
    bool finished = false;
};

// Manual playback clock; records every scheduled buffer.
class FakeAudioOutput : public audio::AudioOutput {
public:
    struct Scheduled {
        double start_time = 0.0;
        double duration = 0.0;
        EndedCallback on_ended;
        std::shared_ptr<FakeHandle> handle;
    };

    double now() const override {
        return clock;
    }

    audio::AudioBuffer decode(const std::string& payload) override {
        if (payload == "garbage") {
            throw audio::AudioDecodeError("not audio");
        }
        return audio::decode_chunk(payload, 16000, 16000);
    }

    std::shared_ptr<audio::PlaybackHandle> schedule(audio::AudioBuffer buffer,
                                                    double start_time,
                                                    EndedCallback on_ended) override {
        Scheduled entry;
        entry.start_time = start_time;
        entry.duration = buffer.duration();
        entry.on_ended = std::move(on_ended);
        entry.handle = std::make_shared<FakeHandle>();
        scheduled.push_back(entry);
        return entry.handle;
    }

    // Simulates natural completion of the i-th scheduled buffer.
    void finish(size_t index) {
        auto& entry = scheduled.at(index);
        entry.handle->finished = true;
        if (entry.on_ended) {
            entry.on_ended();
        }
    }

    double clock = 0.0;
    std::vector<Scheduled> scheduled;
};

struct FakeChannelState {
    std::string url;
    bool open = false;
    bool closed = false;
    bool fail_open = false;
    std::vector<std::string> sent;
    Channel::Handlers handlers;

    void connect() {
        open = true;
        if (handlers.on_open) {
            handlers.on_open();
        }
    }

    void receive_text(const std::string& text) {
        handlers.on_frame(Frame{false, text});
    }

    void receive_binary(const std::string& payload) {
        handlers.on_frame(Frame{true, payload});
    }

    void remote_close(const std::string& reason) {
        open = false;
        if (handlers.on_close) {
            handlers.on_close(reason);
        }
    }
};

class FakeChannel : public Channel {
public:
    explicit FakeChannel(std::shared_ptr<FakeChannelState> state) : state_(std::move(state)) {}

    void open(const std::string& url, Handlers handlers) override {
        if (state_->fail_open) {
            throw ChannelError("refused");
        }
        state_->url = url;
        state_->handlers = std::move(handlers);
    }

    void send_text(const std::string& text) override {
        if (!state_->open) {
            throw ChannelError("not open");
        }
        state_->sent.push_back(text);
    }

    void close() override {
        state_->open = false;
        state_->closed = true;
    }

    bool is_open() const override {
        return state_->open;
    }

private:
    std::shared_ptr<FakeChannelState> state_;
};

// Hands out FakeChannels and keeps their state in creation order.
struct FakeChannelFactory {
    std::vector<std::shared_ptr<FakeChannelState>> channels;
    bool fail_next = false;
    bool transport_broken = false;

    ChannelFactory factory() {
        return [this]() -> std::unique_ptr<Channel> {
            if (transport_broken) {
                throw std::runtime_error("transport init failed");
            }
            auto state = std::make_shared<FakeChannelState>();
            state->fail_open = fail_next;
            channels.push_back(state);
            return std::make_unique<FakeChannel>(state);
        };
    }
};

class FakeRecognizer : public SpeechRecognizer {
public:
    void start(TextCallback interim, TextCallback final_text) override {
        if (fail_start) {
            throw RecognitionError("microphone unavailable");
        }
        on_interim = std::move(interim);
        on_final = std::move(final_text);
        running = true;
        ++starts;
    }

    void stop() override {
        running = false;
    }

    bool is_running() const override {
        return running;
    }

    void say_interim(const std::string& text) {
        on_interim(text);
    }

    void say_final(const std::string& text) {
        on_final(text);
    }

    bool fail_start = false;
    bool running = false;
    int starts = 0;
    TextCallback on_interim;
    TextCallback on_final;
};

}
