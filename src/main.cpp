#include "rtvoice/app.hpp"
#include "rtvoice/config.hpp"
#include "rtvoice/logging.hpp"

#include <string>

int main() {
    try {
        const auto config = rtvoice::Config::load();
        config.validate();
        rtvoice::logging::init(config);
        rtvoice::logging::info(
            "Starting rtvoice",
            {rtvoice::kv("backend_url", config.backend_url),
             rtvoice::kv("realtime_path", config.realtime_path),
             rtvoice::kv("sample_rate", config.audio_sample_rate),
             rtvoice::kv("null_device", config.audio_null_device)});
        rtvoice::VoiceApp app(config);
        app.init();
        app.run();
    } catch (const std::exception& ex) {
        rtvoice::logging::error(
            "Startup failed",
            {rtvoice::kv("error", ex.what())});
        rtvoice::logging::shutdown();
        return 1;
    }
    rtvoice::logging::shutdown();
    return 0;
}
