#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "rtvoice/audio/output.hpp"
#include "rtvoice/audio/playback_scheduler.hpp"
#include "rtvoice/backend/channel.hpp"
#include "rtvoice/conversation/dispatcher.hpp"
#include "rtvoice/conversation/session_channels.hpp"
#include "rtvoice/conversation/tool_tracker.hpp"
#include "rtvoice/conversation/transcript.hpp"
#include "rtvoice/conversation/turn_state.hpp"
#include "rtvoice/core/event_loop.hpp"
#include "rtvoice/recognition/recognizer.hpp"

namespace rtvoice {
namespace conversation {

class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& message) : std::runtime_error(message) {}
};

struct SessionOptions {
    std::string primary_url;
    std::string relay_url;
    std::chrono::milliseconds interrupt_debounce{1000};
    std::chrono::milliseconds playback_lookahead{100};
    std::chrono::milliseconds tool_removal_delay{2000};
    bool send_interrupt_on_stop = true;
};

class Session {
public:
    using CallRequest = std::function<void(const std::string& number)>;
    using CallRunner = std::function<void(std::function<void()>)>;
    using CallDone = std::function<void(bool ok, const std::string& message)>;
    using StoppedHandler = std::function<void(const std::string& reason)>;

    Session(EventLoop& loop,
            audio::AudioOutput& output,
            SpeechRecognizer& recognizer,
            ChannelFactory channel_factory,
            CallRequest call_request,
            SessionOptions options,
            CallRunner call_runner = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void start();
    void stop(const std::string& reason = "stopped");

    void start_call(const std::string& number, CallDone done);
    void hangup();

    void set_on_stopped(StoppedHandler handler);

    bool active() const;
    TurnState state() const;
    const std::string& active_speaker() const;
    const Transcript& transcript() const;
    const ToolTracker& tools() const;
    const audio::PlaybackScheduler& scheduler() const;
    const SessionChannels& channels() const;

private:
    void teardown(const std::string& reason);
    void on_relay_message(const std::string& sender, const std::string& message);
    TurnStateMachine::Hooks make_hooks();
    SessionChannels::Events make_events();

    EventLoop& loop_;
    SpeechRecognizer& recognizer_;
    CallRequest call_request_;
    CallRunner call_runner_;
    SessionOptions options_;
    bool active_ = false;
    StoppedHandler on_stopped_;

    Transcript transcript_;
    audio::PlaybackScheduler scheduler_;
    ToolTracker tools_;
    TurnStateMachine turns_;
    MessageDispatcher dispatcher_;
    SessionChannels channels_;
    LifetimeToken lifetime_;
};

}
}
