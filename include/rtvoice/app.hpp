#pragma once

#include <memory>
#include <string>

#include "rtvoice/audio/engine.hpp"
#include "rtvoice/backend/client.hpp"
#include "rtvoice/config.hpp"
#include "rtvoice/conversation/session.hpp"
#include "rtvoice/core/event_loop.hpp"
#include "rtvoice/recognition/console_recognizer.hpp"

namespace rtvoice {

class VoiceApp {
public:
    explicit VoiceApp(Config config);
    ~VoiceApp();

    void init();
    void run();
    void stop();
    const Config& config() const;

private:
    void handle_command(const std::string& line);
    void start_session();
    void stop_session(const std::string& reason);
    void start_call(const std::string& number);
    void print_transcript() const;
    void probe_health();
    void shutdown();

    Config config_;
    BackendClient backend_client_;
    EventLoop loop_;
    audio::AudioEngine engine_;
    ConsoleRecognizer recognizer_;
    std::unique_ptr<conversation::Session> session_;
    bool shut_down_ = false;
};

}
