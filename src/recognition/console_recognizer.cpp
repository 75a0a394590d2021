#include "rtvoice/recognition/console_recognizer.hpp"

#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

#include "rtvoice/logging.hpp"
#include "rtvoice/utils/text.hpp"

namespace rtvoice {

struct ConsoleRecognizer::State {
    std::mutex mutex;
    bool running = false;
    bool input_open = false;
    TextCallback on_interim;
    TextCallback on_final;
    CommandHandler on_command;
};

namespace {

std::vector<std::string> split_words(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

}

ConsoleRecognizer::ConsoleRecognizer(std::chrono::milliseconds word_interval)
    : state_(std::make_shared<State>()),
      word_interval_(word_interval) {}

ConsoleRecognizer::~ConsoleRecognizer() {
    stop();
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->on_command = nullptr;
}

void ConsoleRecognizer::set_command_handler(CommandHandler handler) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->on_command = std::move(handler);
}

void ConsoleRecognizer::open_input(std::istream& input) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->input_open) {
            return;
        }
        state_->input_open = true;
    }
    std::weak_ptr<State> weak = state_;
    auto interval = word_interval_;
    // getline cannot be interrupted, so the reader only holds weak state.
    std::thread([weak, interval, &input]() {
        std::string line;
        while (std::getline(input, line)) {
            auto state = weak.lock();
            if (!state) {
                return;
            }
            ConsoleRecognizer::process(*state, line, interval);
        }
        if (auto state = weak.lock()) {
            CommandHandler handler;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->input_open = false;
                handler = state->on_command;
            }
            if (handler) {
                handler("/quit");
            }
        }
    }).detach();
}

void ConsoleRecognizer::feed_line(const std::string& line) {
    process(*state_, line, word_interval_);
}

void ConsoleRecognizer::start(TextCallback on_interim, TextCallback on_final) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->running) {
        throw RecognitionError("Console recognizer already running");
    }
    state_->on_interim = std::move(on_interim);
    state_->on_final = std::move(on_final);
    state_->running = true;
    logging::info("Console recognizer listening");
}

void ConsoleRecognizer::stop() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->running) {
        return;
    }
    state_->running = false;
    state_->on_interim = nullptr;
    state_->on_final = nullptr;
    logging::info("Console recognizer stopped");
}

bool ConsoleRecognizer::is_running() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->running;
}

void ConsoleRecognizer::process(State& state,
                                const std::string& raw_line,
                                std::chrono::milliseconds interval) {
    const auto line = utils::trim(raw_line);
    if (line.empty()) {
        return;
    }
    if (line.front() == '/') {
        CommandHandler handler;
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            handler = state.on_command;
        }
        if (handler) {
            handler(line);
        }
        return;
    }

    TextCallback on_interim;
    TextCallback on_final;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.running) {
            logging::info("Speech ignored, no active session (type /start)");
            return;
        }
        on_interim = state.on_interim;
        on_final = state.on_final;
    }

    std::string partial;
    for (const auto& word : split_words(line)) {
        if (!partial.empty()) {
            partial += ' ';
        }
        partial += word;
        if (on_interim) {
            on_interim(partial);
        }
        if (interval.count() > 0) {
            std::this_thread::sleep_for(interval);
        }
    }
    if (on_final) {
        on_final(line);
    }
}

}
