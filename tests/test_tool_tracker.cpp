#include <catch2/catch_test_macros.hpp>

#include "rtvoice/conversation/tool_tracker.hpp"

#include <chrono>

using namespace rtvoice::conversation;
using rtvoice::EventLoop;
using std::chrono::milliseconds;

namespace {

ToolEnd success(const std::string& name, nlohmann::json result, int64_t elapsed) {
    ToolEnd event;
    event.name = name;
    event.status = "success";
    event.result = std::move(result);
    event.elapsed_ms = elapsed;
    return event;
}

}

TEST_CASE("start, progress and end rewrite a single transcript entry") {
    EventLoop loop;
    Transcript transcript;
    int64_t clock = 1000;
    ToolTracker tools(transcript, loop, milliseconds(2000), [&]() { return clock; });

    const auto key = tools.on_start("lookup").key;
    REQUIRE(key == "lookup@1000");
    REQUIRE(transcript.size() == 1);
    REQUIRE(transcript.entries()[0].is_tool);
    REQUIRE(transcript.entries()[0].text == "tool lookup started");

    REQUIRE(tools.on_progress("lookup", 50));
    REQUIRE(transcript.entries()[0].text == "tool lookup 50%");
    REQUIRE(tools.active()[0].progress_pct == 50);

    REQUIRE(tools.on_end(success("lookup", {{"city", "Paris"}}, 120)));
    REQUIRE(transcript.size() == 1);
    const auto& text = transcript.entries()[0].text;
    REQUIRE(text.rfind("tool lookup completed (120 ms)\n", 0) == 0);
    REQUIRE(text.find("\"city\": \"Paris\"") != std::string::npos);
    REQUIRE(tools.active()[0].status == ToolStatus::Succeeded);
}

TEST_CASE("finished tools leave the active set after the removal delay") {
    EventLoop loop;
    Transcript transcript;
    ToolTracker tools(transcript, loop, milliseconds(2000));

    tools.on_start("lookup");
    tools.on_end(success("lookup", nullptr, 10));
    REQUIRE(tools.active().size() == 1);

    const auto now = EventLoop::Clock::now();
    loop.poll(now + milliseconds(1000));
    REQUIRE(tools.active().size() == 1);
    loop.poll(now + milliseconds(2100));
    REQUIRE(tools.active().empty());
    REQUIRE(transcript.size() == 1);
}

TEST_CASE("non-success status marks the invocation failed") {
    EventLoop loop;
    Transcript transcript;
    ToolTracker tools(transcript, loop, milliseconds(2000));

    tools.on_start("search");
    ToolEnd event;
    event.name = "search";
    event.status = "error";
    event.error = "timeout";
    REQUIRE(tools.on_end(event));
    REQUIRE(tools.active()[0].status == ToolStatus::Failed);
    REQUIRE(transcript.entries()[0].text == "tool search failed\ntimeout");
}

TEST_CASE("events match the most recent running invocation by name") {
    EventLoop loop;
    Transcript transcript;
    int64_t clock = 1;
    ToolTracker tools(transcript, loop, milliseconds(2000), [&]() { return clock; });

    tools.on_start("lookup");
    clock = 2;
    tools.on_start("weather");
    clock = 3;
    tools.on_start("lookup");

    tools.on_progress("lookup", 30);
    REQUIRE(transcript.entries()[2].text == "tool lookup 30%");
    REQUIRE(transcript.entries()[0].text == "tool lookup started");

    tools.on_end(success("lookup", nullptr, 5));
    tools.on_progress("lookup", 80);
    REQUIRE(transcript.entries()[0].text == "tool lookup 80%");
}

TEST_CASE("same-millisecond starts get distinct keys") {
    EventLoop loop;
    Transcript transcript;
    ToolTracker tools(transcript, loop, milliseconds(2000), []() { return int64_t{42}; });

    const auto first = tools.on_start("lookup").key;
    const auto second = tools.on_start("lookup").key;
    REQUIRE(first != second);
}

TEST_CASE("unmatched progress and end are ignored") {
    EventLoop loop;
    Transcript transcript;
    ToolTracker tools(transcript, loop, milliseconds(2000));

    REQUIRE_FALSE(tools.on_progress("ghost", 10));
    REQUIRE_FALSE(tools.on_end(success("ghost", nullptr, 1)));
    REQUIRE(transcript.size() == 0);
    REQUIRE(loop.pending() == 0);
}

TEST_CASE("clear empties the active set and pending removals stay harmless") {
    EventLoop loop;
    Transcript transcript;
    ToolTracker tools(transcript, loop, milliseconds(10));

    tools.on_start("lookup");
    tools.on_end(success("lookup", nullptr, 1));
    tools.on_start("other");
    tools.clear();
    REQUIRE(tools.active().empty());
    loop.poll(EventLoop::Clock::now() + milliseconds(50));
    REQUIRE(tools.active().empty());
    REQUIRE(transcript.size() == 2);
}
