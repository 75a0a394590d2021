#pragma once

#include <chrono>
#include <functional>
#include <istream>
#include <memory>
#include <string>

#include "rtvoice/recognition/recognizer.hpp"

namespace rtvoice {

class ConsoleRecognizer : public SpeechRecognizer {
public:
    using CommandHandler = std::function<void(const std::string& command)>;

    explicit ConsoleRecognizer(std::chrono::milliseconds word_interval = std::chrono::milliseconds(0));
    ~ConsoleRecognizer() override;

    void set_command_handler(CommandHandler handler);
    void open_input(std::istream& input);
    void feed_line(const std::string& line);

    void start(TextCallback on_interim, TextCallback on_final) override;
    void stop() override;
    bool is_running() const override;

private:
    struct State;

    static void process(State& state,
                        const std::string& line,
                        std::chrono::milliseconds interval);

    std::shared_ptr<State> state_;
    std::chrono::milliseconds word_interval_;
};

}
