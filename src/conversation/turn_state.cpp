#include "rtvoice/conversation/turn_state.hpp"

#include "rtvoice/logging.hpp"
#include "rtvoice/metrics.hpp"
#include "rtvoice/utils/text.hpp"

namespace rtvoice::conversation {

const char* to_string(TurnState state) {
    switch (state) {
    case TurnState::Idle:
        return "idle";
    case TurnState::Listening:
        return "listening";
    case TurnState::AwaitingResponse:
        return "awaiting_response";
    case TurnState::AssistantStreaming:
        return "assistant_streaming";
    }
    return "unknown";
}

TurnStateMachine::TurnStateMachine(Transcript& transcript,
                                   Hooks hooks,
                                   std::chrono::milliseconds debounce)
    : transcript_(transcript),
      hooks_(std::move(hooks)),
      debounce_(debounce) {}

void TurnStateMachine::start() {
    last_interrupt_.reset();
    awaiting_since_.reset();
    transition(TurnState::Listening);
}

void TurnStateMachine::reset() {
    transcript_.freeze_streaming();
    awaiting_since_.reset();
    active_speaker_.clear();
    transition(TurnState::Idle);
}

bool TurnStateMachine::on_interim(const std::string& text, Clock::time_point now) {
    if (state_ == TurnState::Idle || utils::trim(text).empty()) {
        return false;
    }
    active_speaker_ = kUserSpeaker;
    if (hooks_.flush_playback) {
        hooks_.flush_playback();
    }
    if (!hooks_.channel_open || !hooks_.channel_open()) {
        return false;
    }
    if (last_interrupt_ && now - *last_interrupt_ < debounce_) {
        return false;
    }
    last_interrupt_ = now;
    if (hooks_.send_interrupt) {
        hooks_.send_interrupt();
    }
    Metrics::instance().increment("interrupts_sent");
    logging::debug("Barge-in interrupt sent", {kv("state", to_string(state_))});
    return true;
}

bool TurnStateMachine::on_final(const std::string& text, Clock::time_point now) {
    const auto cleaned = utils::trim(text);
    if (state_ == TurnState::Idle || cleaned.empty()) {
        return false;
    }
    transcript_.freeze_streaming();
    Utterance utterance;
    utterance.speaker = kUserSpeaker;
    utterance.text = cleaned;
    transcript_.append(std::move(utterance));
    active_speaker_ = kUserSpeaker;

    if (hooks_.send_text) {
        hooks_.send_text(cleaned);
    }
    awaiting_since_ = now;
    logging::info("User turn", {kv("text", utils::truncate_for_log(cleaned))});
    transition(TurnState::AwaitingResponse);
    return true;
}

void TurnStateMachine::on_assistant_partial(const std::string& text,
                                            const std::string& speaker,
                                            Clock::time_point now) {
    if (state_ == TurnState::Idle) {
        logging::debug("Assistant fragment ignored while idle");
        return;
    }
    note_response(now);
    transcript_.stream(speaker, text);
    active_speaker_ = speaker;
    transition(TurnState::AssistantStreaming);
}

void TurnStateMachine::on_assistant_final(const std::string& text,
                                          const std::optional<std::string>& speaker,
                                          Clock::time_point now) {
    if (state_ == TurnState::Idle) {
        logging::debug("Assistant message ignored while idle");
        return;
    }
    note_response(now);
    if (!text.empty()) {
        const auto index = transcript_.finalize(speaker, text);
        active_speaker_ = transcript_.entries()[index].speaker;
        logging::info(
            "Assistant turn",
            {kv("speaker", active_speaker_),
             kv("text", utils::truncate_for_log(text))});
    } else {
        transcript_.freeze_streaming();
        if (speaker) {
            active_speaker_ = *speaker;
        }
    }
    transition(TurnState::Listening);
}

TurnState TurnStateMachine::state() const {
    return state_;
}

const std::string& TurnStateMachine::active_speaker() const {
    return active_speaker_;
}

void TurnStateMachine::set_active_speaker(std::string speaker) {
    active_speaker_ = std::move(speaker);
}

void TurnStateMachine::transition(TurnState next) {
    if (next == state_) {
        return;
    }
    logging::debug(
        "Turn state changed",
        {kv("from", to_string(state_)),
         kv("to", to_string(next))});
    state_ = next;
}

void TurnStateMachine::note_response(Clock::time_point now) {
    if (!awaiting_since_) {
        return;
    }
    const auto elapsed = std::chrono::duration<double>(now - *awaiting_since_).count();
    Metrics::instance().observe_latency("first_response", elapsed);
    awaiting_since_.reset();
}

}
