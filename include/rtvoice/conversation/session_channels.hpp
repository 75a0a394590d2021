#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "rtvoice/backend/channel.hpp"
#include "rtvoice/core/event_loop.hpp"

namespace rtvoice {
namespace conversation {

class SessionChannels {
public:
    struct Events {
        std::function<void()> on_primary_open;
        std::function<void(const Frame&)> on_primary_frame;
        std::function<void(const std::string& reason)> on_primary_closed;
        std::function<void()> on_relay_open;
        std::function<void(const Frame&)> on_relay_frame;
        std::function<void(const std::string& reason)> on_relay_closed;
    };

    SessionChannels(EventLoop& loop,
                    ChannelFactory factory,
                    std::string primary_url,
                    std::string relay_url,
                    Events events);
    ~SessionChannels();

    SessionChannels(const SessionChannels&) = delete;
    SessionChannels& operator=(const SessionChannels&) = delete;

    void open_primary();
    void open_relay();

    void close_relay();
    void close_all();

    bool primary_open() const;
    bool primary_active() const;
    bool relay_active() const;

    void send_interrupt();
    void send_text(const std::string& text);

private:
    struct Slot {
        std::unique_ptr<Channel> channel;
        uint64_t generation = 0;
    };

    void open(Slot& slot, const std::string& url, bool relay);
    void close(Slot& slot);
    Channel::Handlers bind(const Slot& slot, bool relay);

    EventLoop& loop_;
    ChannelFactory factory_;
    std::string primary_url_;
    std::string relay_url_;
    Events events_;
    Slot primary_;
    Slot relay_;
    LifetimeToken lifetime_;
};

}
}
