#include "whisper_recognizer.hpp"

#include <algorithm>
#include <filesystem>
#include <print>
#include <thread>
#include <vector>
#include <whisper.h>

static constexpr uint32_t WHISPER_RATE = 16000;

WhisperRecognizer::WhisperRecognizer(whisper_context* ctx, std::string language, int threads)
    : ctx_(ctx), language_(std::move(language)), threads_(threads) {}

WhisperRecognizer::~WhisperRecognizer() {
    if (ctx_) {
        whisper_free(ctx_);
    }
}

std::expected<std::unique_ptr<SpeechRecognizer>, Error>
WhisperRecognizer::load(const ProviderOptions& options) {
    auto model_path = options.extra_or("model_path", "");
    if (model_path.empty()) {
        return std::unexpected(Error{ErrorKind::Configuration,
            "model_path is required for local provider"});
    }
    if (!std::filesystem::exists(model_path)) {
        return std::unexpected(Error{ErrorKind::Configuration,
            "model not found: " + model_path});
    }
    if (options.sample_rate != WHISPER_RATE) {
        return std::unexpected(Error{ErrorKind::Configuration,
            "local provider requires a 16000 Hz sample rate"});
    }

    int threads = 0;
    try {
        threads = std::stoi(options.extra_or("threads", "0"));
    } catch (const std::exception&) {
        return std::unexpected(Error{ErrorKind::Configuration,
            "invalid threads value: " + options.extra_or("threads", "")});
    }
    if (threads <= 0) {
        threads = static_cast<int>(std::clamp(std::thread::hardware_concurrency(), 1u, 8u));
    }

    // whisper wants a bare language code ("en" from "en-US")
    auto language = options.language.substr(0, options.language.find('-'));

    whisper_context_params cparams = whisper_context_default_params();
    whisper_context* ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected(Error{ErrorKind::Configuration,
            "failed to load whisper model: " + model_path});
    }
    std::println(stderr, "whisper: loaded {} ({} threads)", model_path, threads);

    return std::make_unique<WhisperRecognizer>(ctx, language, threads);
}

std::expected<std::string, Error>
WhisperRecognizer::transcribe(std::span<const int16_t> audio, uint32_t sample_rate) {
    if (sample_rate != WHISPER_RATE) {
        return std::unexpected(Error{ErrorKind::Configuration, "unsupported sample rate"});
    }
    if (audio.empty()) {
        return std::string{};
    }

    std::vector<float> pcm(audio.size());
    std::transform(audio.begin(), audio.end(), pcm.begin(),
                   [](int16_t s) { return static_cast<float>(s) / 32768.0f; });

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_realtime = false;
    wparams.print_progress = false;
    wparams.print_timestamps = false;
    wparams.print_special = false;
    wparams.translate = false;
    wparams.single_segment = true;
    wparams.no_context = true;
    wparams.language = language_.c_str();
    wparams.n_threads = threads_;

    std::lock_guard lock(mutex_);
    if (whisper_full(ctx_, wparams, pcm.data(), static_cast<int>(pcm.size())) != 0) {
        return std::unexpected(Error{ErrorKind::BackendConnection, "whisper_full failed"});
    }

    std::string text;
    int n = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n; ++i) {
        const char* seg = whisper_full_get_segment_text(ctx_, i);
        if (!seg) continue;
        std::string s(seg);
        // Non-speech markers such as [BLANK_AUDIO]
        auto a = s.find_first_not_of(" \t\r\n");
        if (a != std::string::npos && s[a] == '[' && s.back() == ']') continue;
        text += s;
    }
    return text;
}
