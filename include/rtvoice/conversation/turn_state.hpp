#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "rtvoice/conversation/transcript.hpp"

namespace rtvoice {
namespace conversation {

enum class TurnState {
    Idle,
    Listening,
    AwaitingResponse,
    AssistantStreaming,
};

const char* to_string(TurnState state);

class TurnStateMachine {
public:
    using Clock = std::chrono::steady_clock;

    struct Hooks {
        std::function<bool()> channel_open;
        std::function<void()> send_interrupt;
        std::function<void(const std::string&)> send_text;
        std::function<void()> flush_playback;
    };

    TurnStateMachine(Transcript& transcript, Hooks hooks, std::chrono::milliseconds debounce);

    void start();
    void reset();

    bool on_interim(const std::string& text, Clock::time_point now = Clock::now());
    bool on_final(const std::string& text, Clock::time_point now = Clock::now());
    void on_assistant_partial(const std::string& text,
                              const std::string& speaker = kAssistantSpeaker,
                              Clock::time_point now = Clock::now());
    void on_assistant_final(const std::string& text,
                            const std::optional<std::string>& speaker = std::nullopt,
                            Clock::time_point now = Clock::now());

    TurnState state() const;
    const std::string& active_speaker() const;
    void set_active_speaker(std::string speaker);

private:
    void transition(TurnState next);
    void note_response(Clock::time_point now);

    Transcript& transcript_;
    Hooks hooks_;
    std::chrono::milliseconds debounce_;
    TurnState state_ = TurnState::Idle;
    std::string active_speaker_;
    std::optional<Clock::time_point> last_interrupt_;
    std::optional<Clock::time_point> awaiting_since_;
};

}
}
