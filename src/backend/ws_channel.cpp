#include "rtvoice/backend/ws_channel.hpp"

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "rtvoice/logging.hpp"

namespace rtvoice {

namespace {

using WsClient = websocketpp::client<websocketpp::config::asio_client>;

}

struct WsChannel::WsState {
    std::shared_ptr<WsClient> client;
    websocketpp::connection_hdl connection;
};

WsChannel::WsChannel(std::optional<std::string> authorization_token)
    : authorization_token_(std::move(authorization_token)) {}

WsChannel::~WsChannel() {
    close();
}

void WsChannel::open(const std::string& url, Handlers handlers) {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (ws_state_) {
        throw ChannelError("Channel already in use");
    }
    handlers_ = std::move(handlers);
    closing_ = false;

    auto client = std::make_shared<WsClient>();
    client->clear_access_channels(websocketpp::log::alevel::all);
    client->clear_error_channels(websocketpp::log::elevel::all);
    client->init_asio();
    WsClient* raw = client.get();

    client->set_open_handler([this](websocketpp::connection_hdl) {
        open_ = true;
        if (handlers_.on_open) {
            handlers_.on_open();
        }
    });
    client->set_message_handler([this](websocketpp::connection_hdl,
                                       WsClient::message_ptr msg) {
        if (!handlers_.on_frame) {
            return;
        }
        Frame frame;
        frame.binary = msg->get_opcode() == websocketpp::frame::opcode::binary;
        frame.payload = msg->get_payload();
        handlers_.on_frame(std::move(frame));
    });
    client->set_close_handler([this, raw](websocketpp::connection_hdl hdl) {
        open_ = false;
        if (closing_) {
            return;
        }
        std::string reason = "closed by remote";
        websocketpp::lib::error_code ec;
        auto conn = raw->get_con_from_hdl(hdl, ec);
        if (!ec && conn) {
            reason = "closed by remote (code " +
                     std::to_string(conn->get_remote_close_code()) + ")";
        }
        if (handlers_.on_close) {
            handlers_.on_close(reason);
        }
    });
    client->set_fail_handler([this, raw](websocketpp::connection_hdl hdl) {
        open_ = false;
        if (closing_) {
            return;
        }
        std::string reason = "connect failed";
        websocketpp::lib::error_code ec;
        auto conn = raw->get_con_from_hdl(hdl, ec);
        if (!ec && conn) {
            reason = "connect failed: " + conn->get_ec().message();
        }
        if (handlers_.on_close) {
            handlers_.on_close(reason);
        }
    });

    websocketpp::lib::error_code ec;
    auto conn = client->get_connection(url, ec);
    if (ec) {
        throw ChannelError("Invalid channel URL " + url + ": " + ec.message());
    }
    if (authorization_token_) {
        conn->append_header("Authorization", "Bearer " + *authorization_token_);
    }
    ws_state_ = std::make_unique<WsState>();
    ws_state_->client = client;
    ws_state_->connection = conn->get_handle();
    client->connect(conn);

    logging::debug("Channel connecting", {kv("url", url)});
    worker_ = std::thread([this]() { run_loop(); });
}

void WsChannel::send_text(const std::string& text) {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (!open_ || !ws_state_ || ws_state_->connection.expired()) {
        throw ChannelError("Channel not open");
    }
    websocketpp::lib::error_code ec;
    ws_state_->client->send(ws_state_->connection, text,
                            websocketpp::frame::opcode::text, ec);
    if (ec) {
        throw ChannelError("Channel send failed: " + ec.message());
    }
}

void WsChannel::close() {
    closing_ = true;
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_ && ws_state_->client) {
            websocketpp::lib::error_code ec;
            if (open_ && !ws_state_->connection.expired()) {
                ws_state_->client->close(ws_state_->connection,
                                         websocketpp::close::status::normal,
                                         "session stopped", ec);
            }
            if (!open_ || ec) {
                ws_state_->client->stop();
            }
        }
    }
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(ws_mutex_);
    ws_state_.reset();
    open_ = false;
}

bool WsChannel::is_open() const {
    return open_;
}

void WsChannel::run_loop() {
    std::shared_ptr<WsClient> client;
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (!ws_state_) {
            return;
        }
        client = ws_state_->client;
    }
    try {
        client->run();
    } catch (const std::exception& ex) {
        logging::error("Channel loop failed", {kv("error", ex.what())});
        open_ = false;
        if (!closing_ && handlers_.on_close) {
            handlers_.on_close(ex.what());
        }
    }
}

}
