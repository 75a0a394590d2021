#include <catch2/catch_test_macros.hpp>

#include "rtvoice/conversation/turn_state.hpp"
#include "rtvoice/metrics.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace rtvoice::conversation;
using std::chrono::milliseconds;

namespace {

struct Recorder {
    bool channel_open = true;
    int interrupts = 0;
    int flushes = 0;
    std::vector<std::string> texts;

    TurnStateMachine::Hooks hooks() {
        TurnStateMachine::Hooks hooks;
        hooks.channel_open = [this]() { return channel_open; };
        hooks.send_interrupt = [this]() { ++interrupts; };
        hooks.send_text = [this](const std::string& text) { texts.push_back(text); };
        hooks.flush_playback = [this]() { ++flushes; };
        return hooks;
    }
};

}

TEST_CASE("session start moves from idle to listening") {
    Transcript transcript;
    Recorder recorder;
    TurnStateMachine turns(transcript, recorder.hooks(), milliseconds(1000));
    REQUIRE(turns.state() == TurnState::Idle);
    turns.start();
    REQUIRE(turns.state() == TurnState::Listening);
}

TEST_CASE("interim fragments are debounced into interrupts") {
    Transcript transcript;
    Recorder recorder;
    TurnStateMachine turns(transcript, recorder.hooks(), milliseconds(1000));
    turns.start();

    const auto t = TurnStateMachine::Clock::now();
    REQUIRE(turns.on_interim("he", t));
    REQUIRE_FALSE(turns.on_interim("hel", t + milliseconds(200)));
    REQUIRE_FALSE(turns.on_interim("hell", t + milliseconds(400)));
    REQUIRE(recorder.interrupts == 1);

    REQUIRE(turns.on_interim("hello", t + milliseconds(1100)));
    REQUIRE(recorder.interrupts == 2);
}

TEST_CASE("every non-empty interim flushes local playback") {
    Transcript transcript;
    Recorder recorder;
    TurnStateMachine turns(transcript, recorder.hooks(), milliseconds(1000));
    turns.start();

    const auto t = TurnStateMachine::Clock::now();
    turns.on_interim("a", t);
    turns.on_interim("ab", t + milliseconds(10));
    turns.on_interim("   ", t + milliseconds(20));
    REQUIRE(recorder.flushes == 2);
}

TEST_CASE("interrupts require an open channel and non-empty text") {
    Transcript transcript;
    Recorder recorder;
    recorder.channel_open = false;
    TurnStateMachine turns(transcript, recorder.hooks(), milliseconds(1000));
    turns.start();

    const auto t = TurnStateMachine::Clock::now();
    REQUIRE_FALSE(turns.on_interim("hello", t));
    recorder.channel_open = true;
    REQUIRE_FALSE(turns.on_interim("  ", t));
    REQUIRE(turns.on_interim("hello", t + milliseconds(5)));
    REQUIRE(recorder.interrupts == 1);
}

TEST_CASE("interims are ignored while idle") {
    Transcript transcript;
    Recorder recorder;
    TurnStateMachine turns(transcript, recorder.hooks(), milliseconds(1000));
    REQUIRE_FALSE(turns.on_interim("hello"));
    REQUIRE(recorder.interrupts == 0);
    REQUIRE(recorder.flushes == 0);
}

TEST_CASE("final text is sent and awaits a response") {
    Transcript transcript;
    Recorder recorder;
    TurnStateMachine turns(transcript, recorder.hooks(), milliseconds(1000));
    turns.start();

    REQUIRE(turns.on_final("  what time is it  "));
    REQUIRE(turns.state() == TurnState::AwaitingResponse);
    REQUIRE(recorder.texts == std::vector<std::string>{"what time is it"});
    REQUIRE(transcript.size() == 1);
    REQUIRE(transcript.entries()[0].speaker == kUserSpeaker);
    REQUIRE(turns.active_speaker() == kUserSpeaker);

    REQUIRE_FALSE(turns.on_final("   "));
    REQUIRE(recorder.texts.size() == 1);
}

TEST_CASE("streamed fragments collapse into a single assistant utterance") {
    Transcript transcript;
    Recorder recorder;
    TurnStateMachine turns(transcript, recorder.hooks(), milliseconds(1000));
    turns.start();
    turns.on_final("hi");

    turns.on_assistant_partial("Hel");
    REQUIRE(turns.state() == TurnState::AssistantStreaming);
    turns.on_assistant_partial("Hello");
    turns.on_assistant_partial("Hello wor");
    turns.on_assistant_final("Hello world");

    REQUIRE(turns.state() == TurnState::Listening);
    REQUIRE(transcript.size() == 2);
    const auto& reply = transcript.entries()[1];
    REQUIRE(reply.speaker == kAssistantSpeaker);
    REQUIRE(reply.text == "Hello world");
    REQUIRE_FALSE(reply.streaming);
}

TEST_CASE("status without text finalizes the open utterance") {
    Transcript transcript;
    Recorder recorder;
    TurnStateMachine turns(transcript, recorder.hooks(), milliseconds(1000));
    turns.start();
    turns.on_assistant_partial("Partial answer");
    turns.on_assistant_final("");
    REQUIRE(turns.state() == TurnState::Listening);
    REQUIRE(transcript.size() == 1);
    REQUIRE(transcript.entries()[0].text == "Partial answer");
    REQUIRE_FALSE(transcript.entries()[0].streaming);
}

TEST_CASE("user final text freezes a still streaming reply") {
    Transcript transcript;
    Recorder recorder;
    TurnStateMachine turns(transcript, recorder.hooks(), milliseconds(1000));
    turns.start();
    turns.on_assistant_partial("Let me expl");
    turns.on_final("stop");
    turns.on_assistant_partial("Okay");

    REQUIRE(transcript.size() == 3);
    REQUIRE(transcript.entries()[0].text == "Let me expl");
    REQUIRE_FALSE(transcript.entries()[0].streaming);
    REQUIRE(transcript.entries()[2].text == "Okay");
}

TEST_CASE("assistant messages are ignored while idle") {
    Transcript transcript;
    Recorder recorder;
    TurnStateMachine turns(transcript, recorder.hooks(), milliseconds(1000));
    turns.on_assistant_partial("late");
    turns.on_assistant_final("late");
    REQUIRE(turns.state() == TurnState::Idle);
    REQUIRE(transcript.size() == 0);
}

TEST_CASE("speaker override labels the utterance") {
    Transcript transcript;
    Recorder recorder;
    TurnStateMachine turns(transcript, recorder.hooks(), milliseconds(1000));
    turns.start();
    turns.on_assistant_final("Booked.", "Scheduler");
    REQUIRE(transcript.entries()[0].speaker == "Scheduler");
    REQUIRE(turns.active_speaker() == "Scheduler");
}

TEST_CASE("reset returns to idle from any state") {
    Transcript transcript;
    Recorder recorder;
    TurnStateMachine turns(transcript, recorder.hooks(), milliseconds(1000));
    turns.start();
    turns.on_assistant_partial("streaming");
    turns.reset();
    REQUIRE(turns.state() == TurnState::Idle);
    REQUIRE(turns.active_speaker().empty());
    REQUIRE_FALSE(transcript.entries()[0].streaming);
}

TEST_CASE("first response latency is recorded once per user turn") {
    rtvoice::Metrics::instance().reset();
    Transcript transcript;
    Recorder recorder;
    TurnStateMachine turns(transcript, recorder.hooks(), milliseconds(1000));
    turns.start();

    const auto t = TurnStateMachine::Clock::now();
    turns.on_final("hi", t);
    turns.on_assistant_partial("H", "Assistant", t + milliseconds(300));
    turns.on_assistant_partial("Hi", "Assistant", t + milliseconds(400));

    const auto rendered = rtvoice::Metrics::instance().render_prometheus();
    REQUIRE(rendered.find("rtvoice_latency_seconds_count{stage=\"first_response\"} 1") !=
            std::string::npos);
}
