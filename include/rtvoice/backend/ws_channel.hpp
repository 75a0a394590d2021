#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "rtvoice/backend/channel.hpp"

namespace rtvoice {

class WsChannel : public Channel {
public:
    explicit WsChannel(std::optional<std::string> authorization_token = std::nullopt);
    ~WsChannel() override;

    void open(const std::string& url, Handlers handlers) override;
    void send_text(const std::string& text) override;
    void close() override;
    bool is_open() const override;

private:
    void run_loop();

    std::optional<std::string> authorization_token_;
    Handlers handlers_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
    std::thread worker_;
    mutable std::mutex ws_mutex_;
    struct WsState;
    std::unique_ptr<WsState> ws_state_;
};

}
