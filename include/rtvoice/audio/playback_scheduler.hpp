#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "rtvoice/audio/output.hpp"
#include "rtvoice/core/event_loop.hpp"

namespace rtvoice {
namespace audio {

class PlaybackScheduler {
public:
    struct Slot {
        double start_time = 0.0;
        double duration = 0.0;
    };

    PlaybackScheduler(AudioOutput& output, EventLoop& loop, double lookahead_sec);

    std::optional<Slot> enqueue(const std::string& payload);
    void stop();

    size_t active_count() const;
    bool is_active() const;
    std::optional<double> next_free_time() const;

private:
    void release(uint64_t id);

    AudioOutput& output_;
    EventLoop& loop_;
    double lookahead_sec_;
    std::optional<double> next_free_time_;
    uint64_t next_id_ = 0;
    std::map<uint64_t, std::shared_ptr<PlaybackHandle>> live_;
    LifetimeToken lifetime_;
};

}
}
