#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rtvoice/conversation/transcript.hpp"
#include "rtvoice/core/event_loop.hpp"

namespace rtvoice {
namespace conversation {

enum class ToolStatus {
    Running,
    Succeeded,
    Failed,
};

const char* to_string(ToolStatus status);

struct ToolInvocation {
    std::string name;
    std::string key;
    ToolStatus status = ToolStatus::Running;
    std::optional<int> progress_pct;
    nlohmann::json result;
    std::string error;
    std::optional<int64_t> elapsed_ms;
    size_t entry_index = 0;
};

struct ToolEnd {
    std::string name;
    std::string status;
    nlohmann::json result;
    std::string error;
    std::optional<int64_t> elapsed_ms;
};

class ToolTracker {
public:
    using MillisClock = std::function<int64_t()>;

    ToolTracker(Transcript& transcript,
                EventLoop& loop,
                std::chrono::milliseconds removal_delay,
                MillisClock clock = {});

    const ToolInvocation& on_start(const std::string& name);
    bool on_progress(const std::string& name, int pct);
    bool on_end(const ToolEnd& event);

    const std::vector<ToolInvocation>& active() const;
    const ToolInvocation* find(const std::string& key) const;
    void clear();

private:
    ToolInvocation* latest_running(const std::string& name);
    void remove(const std::string& key);

    Transcript& transcript_;
    EventLoop& loop_;
    std::chrono::milliseconds removal_delay_;
    MillisClock clock_;
    std::vector<ToolInvocation> active_;
    LifetimeToken lifetime_;
};

}
}
