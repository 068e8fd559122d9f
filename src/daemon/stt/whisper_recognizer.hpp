#pragma once

#include "recognizer.hpp"

#include <mutex>
#include <string>

struct whisper_context;

// whisper.cpp recognizer. Options: model_path (required), threads.
class WhisperRecognizer : public SpeechRecognizer {
public:
    // Takes ownership of ctx; load() is the usual way in.
    WhisperRecognizer(whisper_context* ctx, std::string language, int threads);
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    static std::expected<std::unique_ptr<SpeechRecognizer>, Error>
        load(const ProviderOptions& options);

    std::expected<std::string, Error>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate) override;

private:
    whisper_context* ctx_;
    std::string language_;
    int threads_;
    std::mutex mutex_;
};
