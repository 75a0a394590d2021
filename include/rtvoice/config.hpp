#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace rtvoice {

struct Config {
    std::string backend_url;
    std::string realtime_path = "/realtime";
    std::string relay_path = "/relay";
    std::string call_path = "/api/call";
    std::string health_path = "/health";
    std::optional<std::string> authorization_token;
    double backend_request_timeout = 30.0;
    double backend_connect_timeout = 30.0;
    double backend_sock_read_timeout = 30.0;
    int interrupt_debounce_ms = 1000;
    int playback_lookahead_ms = 100;
    int tool_removal_delay_ms = 2000;
    int stream_sample_rate = 16000;
    int audio_sample_rate = 16000;
    int frame_time_usec = 20000;
    bool audio_null_device = false;
    int audio_log_level = 1;
    bool send_interrupt_on_stop = true;
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;

    static Config load();
    void validate() const;
};

}
