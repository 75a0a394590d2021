#include "rtvoice/conversation/session.hpp"

#include "rtvoice/logging.hpp"
#include "rtvoice/metrics.hpp"
#include "rtvoice/utils/async.hpp"
#include "rtvoice/utils/text.hpp"

namespace rtvoice::conversation {

namespace {

double to_seconds(std::chrono::milliseconds value) {
    return std::chrono::duration<double>(value).count();
}

}

Session::Session(EventLoop& loop,
                 audio::AudioOutput& output,
                 SpeechRecognizer& recognizer,
                 ChannelFactory channel_factory,
                 CallRequest call_request,
                 SessionOptions options,
                 CallRunner call_runner)
    : loop_(loop),
      recognizer_(recognizer),
      call_request_(std::move(call_request)),
      call_runner_(call_runner ? std::move(call_runner) : CallRunner(utils::run_async)),
      options_(std::move(options)),
      scheduler_(output, loop, to_seconds(options_.playback_lookahead)),
      tools_(transcript_, loop, options_.tool_removal_delay),
      turns_(transcript_, make_hooks(), options_.interrupt_debounce),
      dispatcher_(scheduler_, turns_, tools_,
                  [this](const std::string& sender, const std::string& message) {
                      on_relay_message(sender, message);
                  }),
      channels_(loop, std::move(channel_factory), options_.primary_url, options_.relay_url,
                make_events()) {}

Session::~Session() {
    if (active_) {
        teardown("session destroyed");
    }
}

void Session::start() {
    if (active_) {
        throw SessionError("Session already active");
    }
    turns_.start();
    try {
        channels_.open_primary();
    } catch (const std::exception& ex) {
        logging::error("Failed to open conversation channel", {kv("error", ex.what())});
        teardown("channel open failed");
        throw;
    }

    auto weak = lifetime_.watch();
    auto on_interim = [this, weak, &loop = loop_](const std::string& text) {
        loop.post([this, weak, text]() {
            if (weak.lock()) {
                turns_.on_interim(text);
            }
        });
    };
    auto on_final = [this, weak, &loop = loop_](const std::string& text) {
        loop.post([this, weak, text]() {
            if (weak.lock()) {
                turns_.on_final(text);
            }
        });
    };
    try {
        recognizer_.start(on_interim, on_final);
    } catch (const std::exception& ex) {
        logging::error("Failed to start recognition", {kv("error", ex.what())});
        teardown("recognition failed");
        throw;
    }
    active_ = true;
    Metrics::instance().increment("sessions_started");
    logging::info("Session started", {kv("url", options_.primary_url)});
}

void Session::stop(const std::string& reason) {
    if (!active_) {
        return;
    }
    if (options_.send_interrupt_on_stop && channels_.primary_open()) {
        try {
            channels_.send_interrupt();
        } catch (const ChannelError& ex) {
            logging::debug("Interrupt on stop not sent", {kv("error", ex.what())});
        }
    }
    teardown(reason);
}

void Session::start_call(const std::string& number, CallDone done) {
    const auto target = utils::trim(number);
    if (!active_) {
        done(false, "No active session");
        return;
    }
    if (!utils::is_e164_number(target)) {
        logging::warn("Rejected call target", {kv("number", target)});
        done(false, "Invalid phone number, expected E.164 like +15551234567");
        return;
    }
    if (!call_request_) {
        done(false, "Calling is not configured");
        return;
    }

    logging::info("Call initiation requested", {kv("number", target)});
    auto weak = lifetime_.watch();
    auto request = call_request_;
    call_runner_([this, weak, &loop = loop_, request, target, done]() {
        std::string failure;
        try {
            request(target);
        } catch (const std::exception& ex) {
            failure = ex.what();
            if (failure.empty()) {
                failure = "call request failed";
            }
        }
        loop.post([this, weak, target, done, failure]() {
            if (!weak.lock()) {
                return;
            }
            if (!failure.empty()) {
                logging::error(
                    "Call initiation failed",
                    {kv("number", target),
                     kv("error", failure)});
                done(false, failure);
                return;
            }
            if (!active_) {
                done(false, "Session ended before the call was placed");
                return;
            }
            Utterance entry;
            entry.speaker = kAssistantSpeaker;
            entry.text = "Call started -> " + target;
            transcript_.append(std::move(entry));
            try {
                channels_.open_relay();
            } catch (const ChannelError& ex) {
                logging::error("Failed to open relay channel", {kv("error", ex.what())});
                done(false, ex.what());
                return;
            }
            Metrics::instance().increment("calls_started");
            done(true, "Call started -> " + target);
        });
    });
}

void Session::hangup() {
    if (!channels_.relay_active()) {
        return;
    }
    channels_.close_relay();
    if (!turns_.active_speaker().empty() && turns_.active_speaker() != kUserSpeaker &&
        turns_.active_speaker() != kAssistantSpeaker) {
        turns_.set_active_speaker("");
    }
    logging::info("Relay channel closed by user");
}

void Session::set_on_stopped(StoppedHandler handler) {
    on_stopped_ = std::move(handler);
}

bool Session::active() const {
    return active_;
}

TurnState Session::state() const {
    return turns_.state();
}

const std::string& Session::active_speaker() const {
    return turns_.active_speaker();
}

const Transcript& Session::transcript() const {
    return transcript_;
}

const ToolTracker& Session::tools() const {
    return tools_;
}

const audio::PlaybackScheduler& Session::scheduler() const {
    return scheduler_;
}

const SessionChannels& Session::channels() const {
    return channels_;
}

void Session::teardown(const std::string& reason) {
    const bool was_active = active_;
    active_ = false;
    recognizer_.stop();
    scheduler_.stop();
    tools_.clear();
    channels_.close_all();
    turns_.reset();
    if (!was_active) {
        return;
    }
    Metrics::instance().increment("sessions_stopped");
    logging::info("Session stopped", {kv("reason", reason)});
    if (on_stopped_) {
        on_stopped_(reason);
    }
}

void Session::on_relay_message(const std::string& sender, const std::string& message) {
    if (!active_) {
        return;
    }
    Utterance entry;
    entry.speaker = sender;
    entry.text = message;
    transcript_.append(std::move(entry));
    turns_.set_active_speaker(sender);
}

TurnStateMachine::Hooks Session::make_hooks() {
    TurnStateMachine::Hooks hooks;
    hooks.channel_open = [this]() { return channels_.primary_open(); };
    hooks.send_interrupt = [this]() {
        try {
            channels_.send_interrupt();
        } catch (const ChannelError& ex) {
            logging::warn("Interrupt not sent", {kv("error", ex.what())});
        }
    };
    hooks.send_text = [this](const std::string& text) {
        try {
            channels_.send_text(text);
        } catch (const ChannelError& ex) {
            logging::warn(
                "User text not sent",
                {kv("error", ex.what()),
                 kv("text", utils::truncate_for_log(text))});
        }
    };
    hooks.flush_playback = [this]() { scheduler_.stop(); };
    return hooks;
}

SessionChannels::Events Session::make_events() {
    SessionChannels::Events events;
    events.on_primary_frame = [this](const Frame& frame) {
        if (active_) {
            dispatcher_.dispatch(frame);
        }
    };
    events.on_primary_closed = [this](const std::string& reason) {
        if (active_) {
            teardown("conversation channel closed: " + reason);
        }
    };
    events.on_relay_frame = [this](const Frame& frame) {
        if (active_) {
            dispatcher_.dispatch_relay(frame);
        }
    };
    events.on_relay_closed = [this](const std::string& reason) {
        if (active_) {
            teardown("relay channel closed: " + reason);
        }
    };
    return events;
}

}
