#pragma once

#include <memory>

#include <pjsua2.hpp>

#include "rtvoice/audio/mixer.hpp"
#include "rtvoice/audio/port.hpp"
#include "rtvoice/config.hpp"

namespace rtvoice {
namespace audio {

class AudioEngine {
public:
    explicit AudioEngine(const Config& config);
    ~AudioEngine();

    void start();
    void stop();
    VoiceMixer& mixer();

private:
    void init_endpoint();
    void attach_port();

    const Config& config_;
    VoiceMixer mixer_;
    std::unique_ptr<pj::Endpoint> endpoint_;
    std::unique_ptr<AudioMediaPort> port_;
    bool transmitting_ = false;
};

}
}
