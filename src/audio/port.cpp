#include "rtvoice/audio/port.hpp"

#include <algorithm>
#include <cstring>

namespace rtvoice::audio {

void AudioMediaPort::set_on_frame_requested(FrameProvider handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    on_frame_requested_ = std::move(handler);
}

void AudioMediaPort::onFrameRequested(pj::MediaFrame& frame) {
    frame.type = PJMEDIA_FRAME_TYPE_AUDIO;
    FrameProvider provider;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        provider = on_frame_requested_;
    }
    const auto max_samples = static_cast<size_t>(frame.size / sizeof(int16_t));
    if (!provider || max_samples == 0) {
        frame.size = 0;
        frame.buf.clear();
        return;
    }
    const auto data = provider(max_samples);
    if (data.empty()) {
        frame.size = 0;
        frame.buf.clear();
        return;
    }
    const auto copy_samples = std::min(max_samples, data.size());
    const auto copy_bytes = copy_samples * sizeof(int16_t);
    frame.buf.resize(copy_bytes);
    std::memcpy(frame.buf.data(), data.data(), copy_bytes);
    frame.size = static_cast<unsigned>(copy_bytes);
}

void AudioMediaPort::onFrameReceived(pj::MediaFrame& frame) {
    (void)frame;
}

}
