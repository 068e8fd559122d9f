#pragma once

#include "stt/provider.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

struct Config {
    struct Provider {
        std::string type = "deepgram";
        std::string language = "en-US";
        bool continuous = true;
        bool interim_results = true;
    } provider;

    // Per-backend settings keyed by provider name ("deepgram", "local", ...).
    // "credential" is the API key; every other key is passed through as a
    // backend option (url, model, model_path, threads, ...).
    std::map<std::string, std::map<std::string, std::string>> providers;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t connect_timeout_ms = 3000;
        uint32_t buffer_seconds = 30;
    } audio;

    struct Streaming {
        int max_reconnect_attempts = 3;
        uint32_t reconnect_backoff_ms = 500;
        uint32_t flush_timeout_ms = 3000;
        uint32_t keepalive_ms = 5000;
    } streaming;

    // Credential and options for one backend. Credentials missing from the
    // file fall back to DEEPGRAM_API_KEY / ASSEMBLYAI_API_KEY.
    ProviderConfig provider_config(ProviderType type) const;

    void set_credential(ProviderType type, std::string credential);

    static Config from_json(const nlohmann::json& j);
    static Config load(const std::string& path);
    static Config load_default();
};
