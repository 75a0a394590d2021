#include "rtvoice/app.hpp"

#include <iostream>
#include <sstream>

#include "rtvoice/backend/ws_channel.hpp"
#include "rtvoice/logging.hpp"
#include "rtvoice/metrics.hpp"
#include "rtvoice/utils/text.hpp"

namespace rtvoice {

namespace {

constexpr const char* kHelp =
    "commands: /start, /stop, /call <+number>, /hangup, /transcript, /quit";

}

VoiceApp::VoiceApp(Config config)
    : config_(std::move(config)),
      backend_client_(config_.backend_url, config_.authorization_token,
                      {std::chrono::seconds(static_cast<int>(config_.backend_request_timeout)),
                       std::chrono::seconds(static_cast<int>(config_.backend_connect_timeout)),
                       std::chrono::seconds(static_cast<int>(config_.backend_sock_read_timeout))}),
      engine_(config_) {}

VoiceApp::~VoiceApp() {
    shutdown();
}

void VoiceApp::init() {
    probe_health();
    engine_.start();
    recognizer_.set_command_handler([this](const std::string& line) {
        loop_.post([this, line]() { handle_command(line); });
    });
    recognizer_.open_input(std::cin);
    std::cout << kHelp << std::endl;
}

void VoiceApp::run() {
    loop_.run();
    shutdown();
}

void VoiceApp::stop() {
    loop_.post([this]() {
        stop_session("application quit");
        loop_.stop();
    });
}

const Config& VoiceApp::config() const {
    return config_;
}

void VoiceApp::handle_command(const std::string& line) {
    std::istringstream iss(line);
    std::string command;
    iss >> command;
    std::string argument;
    std::getline(iss, argument);
    argument = utils::trim(argument);

    if (command == "/start") {
        start_session();
    } else if (command == "/stop") {
        stop_session("stopped by user");
    } else if (command == "/call") {
        start_call(argument);
    } else if (command == "/hangup") {
        if (session_) {
            session_->hangup();
        }
    } else if (command == "/transcript") {
        print_transcript();
    } else if (command == "/quit") {
        stop_session("application quit");
        loop_.stop();
    } else {
        std::cout << kHelp << std::endl;
    }
}

void VoiceApp::start_session() {
    if (session_) {
        session_->stop("restarted");
        session_.reset();
    }
    conversation::SessionOptions options;
    options.primary_url = to_ws_url(config_.backend_url, config_.realtime_path);
    options.relay_url = to_ws_url(config_.backend_url, config_.relay_path);
    options.interrupt_debounce = std::chrono::milliseconds(config_.interrupt_debounce_ms);
    options.playback_lookahead = std::chrono::milliseconds(config_.playback_lookahead_ms);
    options.tool_removal_delay = std::chrono::milliseconds(config_.tool_removal_delay_ms);
    options.send_interrupt_on_stop = config_.send_interrupt_on_stop;

    auto token = config_.authorization_token;
    auto call_path = config_.call_path;
    session_ = std::make_unique<conversation::Session>(
        loop_, engine_.mixer(), recognizer_,
        [token]() { return std::make_unique<WsChannel>(token); },
        [this, call_path](const std::string& number) {
            backend_client_.post_json(call_path, {{"target_number", number}});
        },
        options);
    session_->set_on_stopped([](const std::string& reason) {
        std::cout << "session ended: " << reason << std::endl;
    });
    try {
        session_->start();
        std::cout << "listening, type to speak" << std::endl;
    } catch (const std::exception& ex) {
        logging::error("Session start failed", {kv("error", ex.what())});
        std::cout << "session start failed: " << ex.what() << std::endl;
        session_.reset();
    }
}

void VoiceApp::stop_session(const std::string& reason) {
    if (!session_) {
        return;
    }
    session_->stop(reason);
}

void VoiceApp::start_call(const std::string& number) {
    if (!session_ || !session_->active()) {
        std::cout << "start a session first" << std::endl;
        return;
    }
    session_->start_call(number, [](bool ok, const std::string& message) {
        std::cout << (ok ? "" : "call failed: ") << message << std::endl;
    });
}

void VoiceApp::print_transcript() const {
    if (!session_) {
        std::cout << "(no session)" << std::endl;
        return;
    }
    std::cout << conversation::render(session_->transcript());
    const auto& tools = session_->tools().active();
    if (!tools.empty()) {
        std::cout << "active tools:";
        for (const auto& tool : tools) {
            std::cout << ' ' << tool.key << '(' << conversation::to_string(tool.status) << ')';
        }
        std::cout << std::endl;
    }
    std::cout << "state: " << conversation::to_string(session_->state());
    if (!session_->active_speaker().empty()) {
        std::cout << ", speaker: " << session_->active_speaker();
    }
    std::cout << std::endl;
}

void VoiceApp::probe_health() {
    try {
        auto health = backend_client_.get_json(config_.health_path);
        logging::info("Backend healthy", {kv("response", health.dump())});
    } catch (const BackendError& ex) {
        logging::warn(
            "Backend health probe failed",
            {kv("path", config_.health_path),
             kv("error", ex.what())});
    }
}

void VoiceApp::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    session_.reset();
    recognizer_.stop();
    recognizer_.set_command_handler(nullptr);
    engine_.stop();
    logging::info("Metrics at shutdown\n" + Metrics::instance().render_prometheus());
}

}
