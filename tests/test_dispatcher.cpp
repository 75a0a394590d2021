#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "rtvoice/conversation/dispatcher.hpp"
#include "rtvoice/metrics.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

using namespace rtvoice::conversation;
using rtvoice::EventLoop;
using rtvoice::Frame;
using rtvoice::testing::FakeAudioOutput;
using rtvoice::testing::pcm_chunk;

namespace {

struct Fixture {
    EventLoop loop;
    FakeAudioOutput output;
    Transcript transcript;
    rtvoice::audio::PlaybackScheduler scheduler{output, loop, 0.1};
    ToolTracker tools{transcript, loop, std::chrono::milliseconds(2000)};
    TurnStateMachine turns{transcript, {}, std::chrono::milliseconds(1000)};
    std::vector<std::pair<std::string, std::string>> relayed;
    MessageDispatcher dispatcher{
        scheduler, turns, tools,
        [this](const std::string& sender, const std::string& message) {
            relayed.emplace_back(sender, message);
        }};

    Fixture() {
        rtvoice::Metrics::instance().reset();
        turns.start();
    }

    DispatchResult text(const std::string& payload) {
        return dispatcher.dispatch(Frame{false, payload});
    }
};

}

TEST_CASE("binary frames go to the playback scheduler") {
    Fixture f;
    REQUIRE(f.dispatcher.dispatch(Frame{true, pcm_chunk(0.2)}) == DispatchResult::Audio);
    REQUIRE(f.scheduler.active_count() == 1);
    REQUIRE(f.turns.state() == TurnState::Listening);
}

TEST_CASE("binary frames are ignored while idle") {
    Fixture f;
    f.turns.reset();
    REQUIRE(f.dispatcher.dispatch(Frame{true, pcm_chunk(0.2)}) == DispatchResult::Ignored);
    REQUIRE(f.scheduler.active_count() == 0);
}

TEST_CASE("unparseable text is discarded without state change") {
    Fixture f;
    REQUIRE(f.text("{not json") == DispatchResult::Malformed);
    REQUIRE(f.text("[1, 2, 3]") == DispatchResult::Malformed);
    REQUIRE(f.text(R"({"content":"no type"})") == DispatchResult::Malformed);
    REQUIRE(f.text(R"({"type":"assistant_streaming","content":42})") == DispatchResult::Malformed);
    REQUIRE(f.text(R"({"type":"tool_progress","tool":"x","pct":"half"})") ==
            DispatchResult::Malformed);
    REQUIRE(f.turns.state() == TurnState::Listening);
    REQUIRE(f.transcript.size() == 0);
    REQUIRE(rtvoice::Metrics::instance().counter("frames_malformed") == 5);
}

TEST_CASE("streaming and final text reach the turn machine") {
    Fixture f;
    REQUIRE(f.text(R"({"type":"assistant_streaming","content":"Hel"})") == DispatchResult::Partial);
    REQUIRE(f.text(R"({"type":"assistant_streaming","content":"Hello"})") == DispatchResult::Partial);
    REQUIRE(f.turns.state() == TurnState::AssistantStreaming);
    REQUIRE(f.text(R"({"type":"assistant","content":"Hello world"})") == DispatchResult::Final);
    REQUIRE(f.turns.state() == TurnState::Listening);
    REQUIRE(f.transcript.size() == 1);
    REQUIRE(f.transcript.entries()[0].text == "Hello world");
}

TEST_CASE("a final without speaker closes an agent's streaming entry") {
    Fixture f;
    f.text(R"({"type":"assistant_streaming","content":"Hel","speaker":"AuthAgent"})");
    f.text(R"({"type":"assistant_streaming","content":"Hello","speaker":"AuthAgent"})");
    f.text(R"({"type":"assistant_streaming","content":"Hello wor","speaker":"AuthAgent"})");
    REQUIRE(f.text(R"({"type":"assistant","content":"Hello world"})") == DispatchResult::Final);

    REQUIRE(f.transcript.size() == 1);
    const auto& reply = f.transcript.entries()[0];
    REQUIRE(reply.speaker == "AuthAgent");
    REQUIRE(reply.text == "Hello world");
    REQUIRE_FALSE(reply.streaming);
    REQUIRE(f.turns.active_speaker() == "AuthAgent");
}

TEST_CASE("status frames finalize and message is a fallback for content") {
    Fixture f;
    f.text(R"({"type":"assistant_streaming","message":"Working"})");
    REQUIRE(f.text(R"({"type":"status","message":"Done","speaker":"Planner"})") ==
            DispatchResult::Final);
    REQUIRE(f.transcript.size() == 2);
    REQUIRE(f.transcript.entries()[0].text == "Working");
    REQUIRE(f.transcript.entries()[1].speaker == "Planner");
}

TEST_CASE("tool frames go to the tool tracker") {
    Fixture f;
    REQUIRE(f.text(R"({"type":"tool_start","tool":"lookup"})") == DispatchResult::Tool);
    REQUIRE(f.text(R"({"type":"tool_progress","tool":"lookup","pct":49.6})") == DispatchResult::Tool);
    REQUIRE(f.tools.active()[0].progress_pct == 50);
    REQUIRE(f.text(R"({"type":"tool_end","tool":"lookup","status":"success","result":{"ok":true},"elapsedMs":120})") ==
            DispatchResult::Tool);
    REQUIRE(f.tools.active()[0].status == ToolStatus::Succeeded);
    REQUIRE(f.tools.active()[0].elapsed_ms == 120);
    REQUIRE(f.turns.state() == TurnState::Listening);
}

TEST_CASE("tool errors given as objects are kept as text") {
    Fixture f;
    f.text(R"({"type":"tool_start","tool":"lookup"})");
    f.text(R"({"type":"tool_end","tool":"lookup","status":"error","error":{"code":7}})");
    REQUIRE(f.tools.active()[0].status == ToolStatus::Failed);
    REQUIRE(f.tools.active()[0].error == R"({"code":7})");
}

TEST_CASE("unknown tags are logged and change nothing") {
    Fixture f;
    REQUIRE_NOTHROW(f.text(R"({"type":"future_feature"})"));
    REQUIRE(f.text(R"({"type":"future_feature"})") == DispatchResult::Unknown);
    REQUIRE(f.turns.state() == TurnState::Listening);
    REQUIRE(f.tools.active().empty());
    REQUIRE(f.scheduler.active_count() == 0);
    REQUIRE(f.transcript.size() == 0);
    REQUIRE(rtvoice::Metrics::instance().counter("frames_unknown") == 2);
}

TEST_CASE("relay records become foreign speaker entries") {
    Fixture f;
    REQUIRE(f.dispatcher.dispatch_relay(Frame{false, R"({"sender":"Bob","message":"hi there"})"}) ==
            DispatchResult::Relay);
    REQUIRE(f.relayed.size() == 1);
    REQUIRE(f.relayed[0].first == "Bob");
    REQUIRE(f.relayed[0].second == "hi there");
}

TEST_CASE("relay tool frames take the tool route") {
    Fixture f;
    REQUIRE(f.dispatcher.dispatch_relay(Frame{false, R"({"type":"tool_start","tool":"transfer"})"}) ==
            DispatchResult::Tool);
    REQUIRE(f.tools.active().size() == 1);
    REQUIRE(f.relayed.empty());
}

TEST_CASE("relay frames without content are ignored") {
    Fixture f;
    REQUIRE(f.dispatcher.dispatch_relay(Frame{false, R"({"sender":"Bob"})"}) ==
            DispatchResult::Ignored);
    REQUIRE(f.dispatcher.dispatch_relay(Frame{true, "abcd"}) == DispatchResult::Ignored);
    REQUIRE(f.dispatcher.dispatch_relay(Frame{false, "nope"}) == DispatchResult::Malformed);
    REQUIRE(f.relayed.empty());
}
