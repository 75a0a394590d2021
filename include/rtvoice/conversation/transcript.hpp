#pragma once

#include <optional>
#include <string>
#include <vector>

namespace rtvoice {
namespace conversation {

inline constexpr const char* kUserSpeaker = "User";
inline constexpr const char* kAssistantSpeaker = "Assistant";
inline constexpr const char* kToolSpeaker = "Tool";

struct Utterance {
    std::string speaker;
    std::string text;
    bool streaming = false;
    bool is_tool = false;
};

class Transcript {
public:
    size_t append(Utterance utterance);

    size_t stream(const std::string& speaker, const std::string& text);
    size_t finalize(const std::optional<std::string>& speaker, const std::string& text);
    void freeze_streaming();

    void update_text(size_t index, const std::string& text);

    std::optional<size_t> streaming_index() const;
    const std::vector<Utterance>& entries() const;
    size_t size() const;

private:
    std::vector<Utterance> entries_;
    std::optional<size_t> streaming_;
};

std::string render(const Transcript& transcript);

}
}
