#include "rtvoice/audio/playback_scheduler.hpp"

#include <algorithm>
#include <exception>

#include "rtvoice/logging.hpp"
#include "rtvoice/metrics.hpp"

namespace rtvoice {
namespace audio {

PlaybackScheduler::PlaybackScheduler(AudioOutput& output, EventLoop& loop, double lookahead_sec)
    : output_(output),
      loop_(loop),
      lookahead_sec_(std::max(0.0, lookahead_sec)) {}

std::optional<PlaybackScheduler::Slot> PlaybackScheduler::enqueue(const std::string& payload) {
    AudioBuffer buffer;
    try {
        buffer = output_.decode(payload);
    } catch (const AudioDecodeError& ex) {
        Metrics::instance().increment("audio_decode_failed");
        logging::warn(
            "Audio chunk dropped (decode failed)",
            {kv("error", ex.what()),
             kv("bytes", payload.size())});
        return std::nullopt;
    }

    const double now = output_.now();
    if (!next_free_time_) {
        next_free_time_ = now;
    }
    Slot slot;
    slot.start_time = std::max(*next_free_time_, now + lookahead_sec_);
    slot.duration = buffer.duration();

    const auto id = next_id_++;
    auto on_release = lifetime_.guard([this, id]() { release(id); });
    std::shared_ptr<PlaybackHandle> handle;
    try {
        handle = output_.schedule(
            std::move(buffer), slot.start_time,
            [&loop = loop_, on_release]() { loop.post(on_release); });
    } catch (const PlaybackError& ex) {
        logging::warn(
            "Audio chunk dropped (schedule failed)",
            {kv("error", ex.what())});
        return std::nullopt;
    }
    next_free_time_ = slot.start_time + slot.duration;
    if (handle) {
        live_[id] = std::move(handle);
    }
    Metrics::instance().increment("audio_chunks_scheduled");
    logging::trace(
        "Audio chunk scheduled",
        {kv("start_sec", slot.start_time),
         kv("duration_sec", slot.duration),
         kv("live", live_.size())});
    return slot;
}

void PlaybackScheduler::stop() {
    auto handles = std::move(live_);
    live_.clear();
    for (auto& entry : handles) {
        try {
            entry.second->stop();
        } catch (const PlaybackError& ex) {
            logging::trace(
                "Playback handle already finished",
                {kv("error", ex.what())});
        }
    }
    if (next_free_time_) {
        next_free_time_ = output_.now();
    }
    if (!handles.empty()) {
        logging::debug(
            "Playback flushed",
            {kv("stopped", handles.size())});
    }
}

size_t PlaybackScheduler::active_count() const {
    return live_.size();
}

bool PlaybackScheduler::is_active() const {
    return !live_.empty();
}

std::optional<double> PlaybackScheduler::next_free_time() const {
    return next_free_time_;
}

void PlaybackScheduler::release(uint64_t id) {
    live_.erase(id);
}

}
}
