#include "rtvoice/conversation/tool_tracker.hpp"

#include <algorithm>

#include "rtvoice/logging.hpp"
#include "rtvoice/metrics.hpp"

namespace rtvoice::conversation {

namespace {

int64_t system_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string summary(const ToolInvocation& tool) {
    std::string text = "tool " + tool.name;
    switch (tool.status) {
    case ToolStatus::Running:
        if (tool.progress_pct) {
            return text + " " + std::to_string(*tool.progress_pct) + "%";
        }
        return text + " started";
    case ToolStatus::Succeeded:
        text += " completed";
        break;
    case ToolStatus::Failed:
        text += " failed";
        break;
    }
    if (tool.elapsed_ms) {
        text += " (" + std::to_string(*tool.elapsed_ms) + " ms)";
    }
    if (tool.status == ToolStatus::Succeeded && !tool.result.is_null()) {
        text += "\n" + tool.result.dump(2);
    }
    if (tool.status == ToolStatus::Failed && !tool.error.empty()) {
        text += "\n" + tool.error;
    }
    return text;
}

}

const char* to_string(ToolStatus status) {
    switch (status) {
    case ToolStatus::Running:
        return "running";
    case ToolStatus::Succeeded:
        return "succeeded";
    case ToolStatus::Failed:
        return "failed";
    }
    return "unknown";
}

ToolTracker::ToolTracker(Transcript& transcript,
                         EventLoop& loop,
                         std::chrono::milliseconds removal_delay,
                         MillisClock clock)
    : transcript_(transcript),
      loop_(loop),
      removal_delay_(removal_delay),
      clock_(clock ? std::move(clock) : MillisClock(system_millis)) {}

const ToolInvocation& ToolTracker::on_start(const std::string& name) {
    ToolInvocation tool;
    tool.name = name;
    const auto base_key = name + "@" + std::to_string(clock_());
    tool.key = base_key;
    for (int suffix = 1; find(tool.key) != nullptr; ++suffix) {
        tool.key = base_key + "#" + std::to_string(suffix);
    }

    Utterance entry;
    entry.speaker = kToolSpeaker;
    entry.text = summary(tool);
    entry.is_tool = true;
    tool.entry_index = transcript_.append(std::move(entry));

    Metrics::instance().increment("tool_started");
    logging::info("Tool started", {kv("tool", name), kv("key", tool.key)});
    active_.push_back(std::move(tool));
    return active_.back();
}

bool ToolTracker::on_progress(const std::string& name, int pct) {
    auto* tool = latest_running(name);
    if (!tool) {
        logging::warn("Tool progress without running invocation", {kv("tool", name)});
        return false;
    }
    tool->progress_pct = std::clamp(pct, 0, 100);
    transcript_.update_text(tool->entry_index, summary(*tool));
    logging::debug(
        "Tool progress",
        {kv("tool", name),
         kv("pct", *tool->progress_pct)});
    return true;
}

bool ToolTracker::on_end(const ToolEnd& event) {
    auto* tool = latest_running(event.name);
    if (!tool) {
        logging::warn("Tool end without running invocation", {kv("tool", event.name)});
        return false;
    }
    tool->status = event.status == "success" ? ToolStatus::Succeeded : ToolStatus::Failed;
    tool->result = event.result;
    tool->error = event.error;
    tool->elapsed_ms = event.elapsed_ms;
    transcript_.update_text(tool->entry_index, summary(*tool));

    Metrics::instance().increment(tool->status == ToolStatus::Succeeded ? "tool_succeeded"
                                                                        : "tool_failed");
    logging::info(
        "Tool finished",
        {kv("tool", event.name),
         kv("status", to_string(tool->status)),
         kv("elapsed_ms", event.elapsed_ms ? std::to_string(*event.elapsed_ms) : "n/a")});

    loop_.post_after(removal_delay_,
                     lifetime_.guard([this, key = tool->key]() { remove(key); }));
    return true;
}

const std::vector<ToolInvocation>& ToolTracker::active() const {
    return active_;
}

const ToolInvocation* ToolTracker::find(const std::string& key) const {
    auto it = std::find_if(active_.begin(), active_.end(),
                           [&](const ToolInvocation& tool) { return tool.key == key; });
    return it == active_.end() ? nullptr : &*it;
}

void ToolTracker::clear() {
    active_.clear();
}

ToolInvocation* ToolTracker::latest_running(const std::string& name) {
    auto it = std::find_if(active_.rbegin(), active_.rend(), [&](const ToolInvocation& tool) {
        return tool.name == name && tool.status == ToolStatus::Running;
    });
    return it == active_.rend() ? nullptr : &*it;
}

void ToolTracker::remove(const std::string& key) {
    auto it = std::find_if(active_.begin(), active_.end(),
                           [&](const ToolInvocation& tool) { return tool.key == key; });
    if (it == active_.end() || it->status == ToolStatus::Running) {
        return;
    }
    active_.erase(it);
}

}
