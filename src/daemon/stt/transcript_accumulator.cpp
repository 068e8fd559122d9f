#include "transcript_accumulator.hpp"

#include <cctype>

namespace {

bool is_blank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

} // namespace

bool TranscriptAccumulator::apply(const TranscriptEvent& event) {
    if (sealed_) return false;

    if (last_index_ && event.sequence_index < *last_index_) return false;
    if (last_final_index_ && event.sequence_index == *last_final_index_) return false;
    last_index_ = event.sequence_index;

    if (!event.is_final) {
        if (interim_ == event.text) return false;
        interim_ = event.text;
        return true;
    }

    last_final_index_ = event.sequence_index;
    bool changed = !interim_.empty();
    interim_.clear();
    if (!is_blank(event.text)) {
        append_final(event.text);
        changed = true;
    }
    return changed;
}

void TranscriptAccumulator::seal() {
    sealed_ = true;
    interim_.clear();
}

void TranscriptAccumulator::reset() {
    final_.clear();
    interim_.clear();
    last_index_.reset();
    last_final_index_.reset();
    sealed_ = false;
}

void TranscriptAccumulator::append_final(const std::string& text) {
    if (!final_.empty() && !std::isspace(static_cast<unsigned char>(final_.back())) &&
        !std::isspace(static_cast<unsigned char>(text.front()))) {
        final_ += ' ';
    }
    final_ += text;
}
