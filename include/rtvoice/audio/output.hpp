#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "rtvoice/audio/wav.hpp"

namespace rtvoice {
namespace audio {

class PlaybackError : public std::runtime_error {
public:
    explicit PlaybackError(const std::string& message) : std::runtime_error(message) {}
};

class PlaybackHandle {
public:
    virtual ~PlaybackHandle() = default;

    virtual void stop() = 0;
};

class AudioOutput {
public:
    using EndedCallback = std::function<void()>;

    virtual ~AudioOutput() = default;

    virtual double now() const = 0;
    virtual AudioBuffer decode(const std::string& payload) = 0;
    // `on_ended` fires once on natural completion, possibly from another thread.
    virtual std::shared_ptr<PlaybackHandle> schedule(AudioBuffer buffer,
                                                     double start_time,
                                                     EndedCallback on_ended) = 0;
};

}
}
