#include "rtvoice/conversation/session_channels.hpp"

#include <nlohmann/json.hpp>

#include "rtvoice/logging.hpp"

namespace rtvoice::conversation {

SessionChannels::SessionChannels(EventLoop& loop,
                                 ChannelFactory factory,
                                 std::string primary_url,
                                 std::string relay_url,
                                 Events events)
    : loop_(loop),
      factory_(std::move(factory)),
      primary_url_(std::move(primary_url)),
      relay_url_(std::move(relay_url)),
      events_(std::move(events)) {}

SessionChannels::~SessionChannels() {
    close_all();
}

void SessionChannels::open_primary() {
    open(primary_, primary_url_, false);
}

void SessionChannels::open_relay() {
    open(relay_, relay_url_, true);
}

void SessionChannels::close_relay() {
    close(relay_);
}

void SessionChannels::close_all() {
    close(relay_);
    close(primary_);
}

bool SessionChannels::primary_open() const {
    return primary_.channel && primary_.channel->is_open();
}

bool SessionChannels::primary_active() const {
    return primary_.channel != nullptr;
}

bool SessionChannels::relay_active() const {
    return relay_.channel != nullptr;
}

void SessionChannels::send_interrupt() {
    if (!primary_open()) {
        throw ChannelError("Primary channel not open");
    }
    primary_.channel->send_text(nlohmann::json{{"type", "interrupt"}}.dump());
}

void SessionChannels::send_text(const std::string& text) {
    if (!primary_open()) {
        throw ChannelError("Primary channel not open");
    }
    primary_.channel->send_text(nlohmann::json{{"text", text}}.dump());
}

void SessionChannels::open(Slot& slot, const std::string& url, bool relay) {
    close(slot);
    ++slot.generation;
    auto channel = factory_ ? factory_() : nullptr;
    if (!channel) {
        throw ChannelError("No channel available");
    }
    channel->open(url, bind(slot, relay));
    slot.channel = std::move(channel);
    logging::info(
        "Channel opening",
        {kv("channel", relay ? "relay" : "primary"),
         kv("url", url)});
}

void SessionChannels::close(Slot& slot) {
    ++slot.generation;
    if (!slot.channel) {
        return;
    }
    auto channel = std::move(slot.channel);
    channel->close();
}

Channel::Handlers SessionChannels::bind(const Slot& slot, bool relay) {
    const auto generation = slot.generation;
    auto weak = lifetime_.watch();
    // Runs on the channel thread; everything past the post runs on the loop.
    auto post = [this, weak, relay, generation, &loop = loop_](EventLoop::Task task) {
        loop.post([this, weak, relay, generation, task = std::move(task)]() {
            if (!weak.lock()) {
                return;
            }
            const auto& current = relay ? relay_ : primary_;
            if (current.generation != generation || !current.channel) {
                return;
            }
            task();
        });
    };

    Channel::Handlers handlers;
    handlers.on_open = [this, post, relay]() {
        post([this, relay]() {
            logging::info("Channel open", {kv("channel", relay ? "relay" : "primary")});
            const auto& callback = relay ? events_.on_relay_open : events_.on_primary_open;
            if (callback) {
                callback();
            }
        });
    };
    handlers.on_frame = [this, post, relay](Frame frame) {
        post([this, relay, frame = std::move(frame)]() {
            const auto& callback = relay ? events_.on_relay_frame : events_.on_primary_frame;
            if (callback) {
                callback(frame);
            }
        });
    };
    handlers.on_close = [this, post, relay](const std::string& reason) {
        post([this, relay, reason]() {
            logging::warn(
                "Channel closed",
                {kv("channel", relay ? "relay" : "primary"),
                 kv("reason", reason)});
            const auto& callback = relay ? events_.on_relay_closed : events_.on_primary_closed;
            if (callback) {
                callback(reason);
            }
        });
    };
    return handlers;
}

}
