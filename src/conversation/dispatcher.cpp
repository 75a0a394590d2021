#include "rtvoice/conversation/dispatcher.hpp"

#include <cmath>

#include "rtvoice/logging.hpp"
#include "rtvoice/metrics.hpp"
#include "rtvoice/utils/text.hpp"

namespace rtvoice::conversation {

namespace {

std::string text_field(const nlohmann::json& record) {
    for (const char* key : {"content", "message"}) {
        auto it = record.find(key);
        if (it != record.end() && !it->is_null()) {
            return it->get<std::string>();
        }
    }
    return "";
}

std::optional<std::string> speaker_field(const nlohmann::json& record) {
    auto it = record.find("speaker");
    if (it == record.end() || it->is_null()) {
        return std::nullopt;
    }
    auto speaker = it->get<std::string>();
    if (speaker.empty()) {
        return std::nullopt;
    }
    return speaker;
}

}

const char* to_string(DispatchResult result) {
    switch (result) {
    case DispatchResult::Audio:
        return "audio";
    case DispatchResult::Partial:
        return "partial";
    case DispatchResult::Final:
        return "final";
    case DispatchResult::Tool:
        return "tool";
    case DispatchResult::Relay:
        return "relay";
    case DispatchResult::Malformed:
        return "malformed";
    case DispatchResult::Unknown:
        return "unknown";
    case DispatchResult::Ignored:
        return "ignored";
    }
    return "unknown";
}

MessageDispatcher::MessageDispatcher(audio::PlaybackScheduler& scheduler,
                                     TurnStateMachine& turns,
                                     ToolTracker& tools,
                                     RelayHandler on_relay)
    : scheduler_(scheduler),
      turns_(turns),
      tools_(tools),
      on_relay_(std::move(on_relay)) {}

DispatchResult MessageDispatcher::dispatch(const Frame& frame) {
    if (frame.binary) {
        if (turns_.state() == TurnState::Idle) {
            logging::debug("Audio frame ignored while idle", {kv("bytes", frame.payload.size())});
            return count(DispatchResult::Ignored);
        }
        scheduler_.enqueue(frame.payload);
        return count(DispatchResult::Audio);
    }
    auto record = parse(frame, "primary");
    if (!record) {
        return count(DispatchResult::Malformed);
    }
    try {
        return count(route(*record));
    } catch (const nlohmann::json::exception& ex) {
        logging::warn(
            "Malformed frame fields",
            {kv("error", ex.what()),
             kv("payload", utils::truncate_for_log(frame.payload))});
        return count(DispatchResult::Malformed);
    }
}

DispatchResult MessageDispatcher::dispatch_relay(const Frame& frame) {
    if (frame.binary) {
        logging::debug("Binary relay frame ignored", {kv("bytes", frame.payload.size())});
        return count(DispatchResult::Ignored);
    }
    auto record = parse(frame, "relay");
    if (!record) {
        return count(DispatchResult::Malformed);
    }
    try {
        const auto type = record->value("type", std::string());
        if (type.rfind("tool_", 0) == 0) {
            return count(route_tool(type, *record));
        }
        return count(route_relay(*record));
    } catch (const nlohmann::json::exception& ex) {
        logging::warn(
            "Malformed relay frame fields",
            {kv("error", ex.what()),
             kv("payload", utils::truncate_for_log(frame.payload))});
        return count(DispatchResult::Malformed);
    }
}

std::optional<nlohmann::json> MessageDispatcher::parse(const Frame& frame,
                                                       const char* channel) const {
    try {
        auto record = nlohmann::json::parse(frame.payload);
        if (!record.is_object()) {
            logging::warn(
                "Frame is not a JSON object",
                {kv("channel", channel),
                 kv("payload", utils::truncate_for_log(frame.payload))});
            return std::nullopt;
        }
        return record;
    } catch (const nlohmann::json::parse_error& ex) {
        logging::warn(
            "Failed to parse frame",
            {kv("channel", channel),
             kv("error", ex.what()),
             kv("payload", utils::truncate_for_log(frame.payload))});
        return std::nullopt;
    }
}

DispatchResult MessageDispatcher::route(const nlohmann::json& record) {
    auto it = record.find("type");
    if (it == record.end() || !it->is_string()) {
        logging::warn("Frame without type tag", {kv("payload", utils::truncate_for_log(record.dump()))});
        return DispatchResult::Malformed;
    }
    const auto type = it->get<std::string>();
    if (type == "assistant_streaming") {
        turns_.on_assistant_partial(text_field(record),
                                    speaker_field(record).value_or(kAssistantSpeaker));
        return DispatchResult::Partial;
    }
    if (type == "assistant" || type == "status") {
        turns_.on_assistant_final(text_field(record), speaker_field(record));
        return DispatchResult::Final;
    }
    if (type.rfind("tool_", 0) == 0) {
        return route_tool(type, record);
    }
    logging::info("Unknown frame type ignored", {kv("type", type)});
    return DispatchResult::Unknown;
}

DispatchResult MessageDispatcher::route_tool(const std::string& type,
                                             const nlohmann::json& record) {
    const auto name = record.at("tool").get<std::string>();
    if (type == "tool_start") {
        tools_.on_start(name);
        return DispatchResult::Tool;
    }
    if (type == "tool_progress") {
        const auto pct = record.at("pct").get<double>();
        tools_.on_progress(name, static_cast<int>(std::lround(pct)));
        return DispatchResult::Tool;
    }
    if (type == "tool_end") {
        ToolEnd event;
        event.name = name;
        event.status = record.value("status", std::string());
        event.result = record.value("result", nlohmann::json());
        auto error = record.find("error");
        if (error != record.end() && !error->is_null()) {
            event.error = error->is_string() ? error->get<std::string>() : error->dump();
        }
        auto elapsed = record.find("elapsedMs");
        if (elapsed != record.end() && !elapsed->is_null()) {
            event.elapsed_ms = static_cast<int64_t>(std::llround(elapsed->get<double>()));
        }
        tools_.on_end(event);
        return DispatchResult::Tool;
    }
    logging::info("Unknown tool event ignored", {kv("type", type)});
    return DispatchResult::Unknown;
}

DispatchResult MessageDispatcher::route_relay(const nlohmann::json& record) {
    const auto sender = record.value("sender", std::string("Caller"));
    const auto message = record.value("message", std::string());
    if (utils::trim(message).empty()) {
        return DispatchResult::Ignored;
    }
    if (on_relay_) {
        on_relay_(sender.empty() ? std::string("Caller") : sender, message);
    }
    return DispatchResult::Relay;
}

DispatchResult MessageDispatcher::count(DispatchResult result) const {
    Metrics::instance().increment(std::string("frames_") + to_string(result));
    return result;
}

}
