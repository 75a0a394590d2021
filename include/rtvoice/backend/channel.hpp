#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace rtvoice {

class ChannelError : public std::runtime_error {
public:
    explicit ChannelError(const std::string& message) : std::runtime_error(message) {}
};

struct Frame {
    bool binary = false;
    std::string payload;
};

// on_close reports remote closure or connect failure, never a local close().
class Channel {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(Frame)> on_frame;
        std::function<void(const std::string& reason)> on_close;
    };

    virtual ~Channel() = default;

    virtual void open(const std::string& url, Handlers handlers) = 0;
    virtual void send_text(const std::string& text) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

using ChannelFactory = std::function<std::unique_ptr<Channel>()>;

std::string to_ws_url(const std::string& base_url, const std::string& path);

}
