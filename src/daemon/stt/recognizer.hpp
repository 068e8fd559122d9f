#pragma once

#include "../error.hpp"
#include "provider.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>

// Offline speech-to-text engine run in process by the local provider.
class SpeechRecognizer {
public:
    virtual ~SpeechRecognizer() = default;
    virtual std::expected<std::string, Error>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate) = 0;
};

// Loads a recognizer (model files etc.) for the given options.
using RecognizerFactory = std::function<
    std::expected<std::unique_ptr<SpeechRecognizer>, Error>(const ProviderOptions&)>;
