#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include <pjsua2.hpp>

namespace rtvoice {
namespace audio {

class AudioMediaPort : public pj::AudioMediaPort {
public:
    using FrameProvider = std::function<std::vector<int16_t>(size_t samples)>;

    AudioMediaPort() = default;
    ~AudioMediaPort() override = default;

    void set_on_frame_requested(FrameProvider handler);

    void onFrameRequested(pj::MediaFrame& frame) override;
    void onFrameReceived(pj::MediaFrame& frame) override;

private:
    FrameProvider on_frame_requested_;
    std::mutex handler_mutex_;
};

}
}
