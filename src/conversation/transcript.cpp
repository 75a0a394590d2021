#include "rtvoice/conversation/transcript.hpp"

#include <sstream>
#include <stdexcept>

namespace rtvoice::conversation {

size_t Transcript::append(Utterance utterance) {
    if (utterance.streaming) {
        freeze_streaming();
    }
    entries_.push_back(std::move(utterance));
    const auto index = entries_.size() - 1;
    if (entries_.back().streaming) {
        streaming_ = index;
    }
    return index;
}

size_t Transcript::stream(const std::string& speaker, const std::string& text) {
    if (streaming_ && entries_[*streaming_].speaker == speaker) {
        entries_[*streaming_].text = text;
        return *streaming_;
    }
    Utterance utterance;
    utterance.speaker = speaker;
    utterance.text = text;
    utterance.streaming = true;
    return append(std::move(utterance));
}

size_t Transcript::finalize(const std::optional<std::string>& speaker,
                            const std::string& text) {
    if (streaming_) {
        const auto index = *streaming_;
        auto& entry = entries_[index];
        entry.text = text;
        if (speaker) {
            entry.speaker = *speaker;
        }
        entry.streaming = false;
        streaming_.reset();
        return index;
    }
    Utterance utterance;
    utterance.speaker = speaker.value_or(kAssistantSpeaker);
    utterance.text = text;
    return append(std::move(utterance));
}

void Transcript::freeze_streaming() {
    if (!streaming_) {
        return;
    }
    entries_[*streaming_].streaming = false;
    streaming_.reset();
}

void Transcript::update_text(size_t index, const std::string& text) {
    if (index >= entries_.size()) {
        throw std::out_of_range("transcript index " + std::to_string(index));
    }
    entries_[index].text = text;
}

std::optional<size_t> Transcript::streaming_index() const {
    return streaming_;
}

const std::vector<Utterance>& Transcript::entries() const {
    return entries_;
}

size_t Transcript::size() const {
    return entries_.size();
}

std::string render(const Transcript& transcript) {
    std::ostringstream oss;
    for (const auto& entry : transcript.entries()) {
        if (entry.is_tool) {
            oss << "  [" << entry.text << "]";
        } else {
            oss << entry.speaker << ": " << entry.text;
        }
        if (entry.streaming) {
            oss << " ...";
        }
        oss << '\n';
    }
    return oss.str();
}

}
