#pragma once

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "rtvoice/audio/playback_scheduler.hpp"
#include "rtvoice/backend/channel.hpp"
#include "rtvoice/conversation/tool_tracker.hpp"
#include "rtvoice/conversation/turn_state.hpp"

namespace rtvoice {
namespace conversation {

enum class DispatchResult {
    Audio,
    Partial,
    Final,
    Tool,
    Relay,
    Malformed,
    Unknown,
    Ignored,
};

const char* to_string(DispatchResult result);

class MessageDispatcher {
public:
    using RelayHandler =
        std::function<void(const std::string& sender, const std::string& message)>;

    MessageDispatcher(audio::PlaybackScheduler& scheduler,
                      TurnStateMachine& turns,
                      ToolTracker& tools,
                      RelayHandler on_relay);

    DispatchResult dispatch(const Frame& frame);
    DispatchResult dispatch_relay(const Frame& frame);

private:
    std::optional<nlohmann::json> parse(const Frame& frame, const char* channel) const;
    DispatchResult route(const nlohmann::json& record);
    DispatchResult route_tool(const std::string& type, const nlohmann::json& record);
    DispatchResult route_relay(const nlohmann::json& record);
    DispatchResult count(DispatchResult result) const;

    audio::PlaybackScheduler& scheduler_;
    TurnStateMachine& turns_;
    ToolTracker& tools_;
    RelayHandler on_relay_;
};

}
}
