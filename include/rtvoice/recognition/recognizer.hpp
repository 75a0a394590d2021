#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace rtvoice {

class RecognitionError : public std::runtime_error {
public:
    explicit RecognitionError(const std::string& message) : std::runtime_error(message) {}
};

class SpeechRecognizer {
public:
    using TextCallback = std::function<void(const std::string&)>;

    virtual ~SpeechRecognizer() = default;

    virtual void start(TextCallback on_interim, TextCallback on_final) = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;
};

}
