#pragma once

#include "provider.hpp"

#include <cstdint>
#include <optional>
#include <string>

// Folds a provider's ordered event stream into a stable final transcript
// (append-only) and a volatile interim transcript (replaced in place).
class TranscriptAccumulator {
public:
    // Returns true if either view changed.
    bool apply(const TranscriptEvent& event);

    void clear_interim() { interim_.clear(); }

    // After seal() every event is discarded until reset().
    void seal();
    void reset();

    const std::string& final_text() const { return final_; }
    const std::string& interim_text() const { return interim_; }
    bool sealed() const { return sealed_; }

private:
    void append_final(const std::string& text);

    std::string final_;
    std::string interim_;
    std::optional<uint64_t> last_index_;
    std::optional<uint64_t> last_final_index_;
    bool sealed_ = false;
};
