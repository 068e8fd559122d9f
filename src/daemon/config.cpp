#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

static const char* credential_env(ProviderType type) {
    switch (type) {
        case ProviderType::Deepgram: return "DEEPGRAM_API_KEY";
        case ProviderType::AssemblyAI: return "ASSEMBLYAI_API_KEY";
        case ProviderType::Local:
        case ProviderType::RealtimeStt: return nullptr;
    }
    return nullptr;
}

// Scalar JSON values become option strings; "16000" and 16000 are equivalent.
static std::string option_string(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    return v.dump();
}

ProviderConfig Config::provider_config(ProviderType type) const {
    ProviderConfig pc;
    pc.type = type;
    pc.options.language = provider.language;
    pc.options.continuous = provider.continuous;
    pc.options.interim_results = provider.interim_results;
    pc.options.sample_rate = audio.sample_rate;

    auto it = providers.find(std::string(provider_type_name(type)));
    if (it != providers.end()) {
        for (auto& [key, value] : it->second) {
            if (key == "credential") {
                if (!value.empty()) pc.credential = value;
            } else {
                pc.options.extra[key] = value;
            }
        }
    }

    if (!pc.credential) {
        if (auto* env = credential_env(type)) {
            const char* key = std::getenv(env);
            if (key && *key) pc.credential = std::string(key);
        }
    }
    return pc;
}

void Config::set_credential(ProviderType type, std::string credential) {
    providers[std::string(provider_type_name(type))]["credential"] = std::move(credential);
}

Config Config::from_json(const json& j) {
    Config cfg;

    if (j.contains("provider")) {
        auto& p = j["provider"];
        if (p.contains("type")) cfg.provider.type = p["type"].get<std::string>();
        if (p.contains("language")) cfg.provider.language = p["language"].get<std::string>();
        if (p.contains("continuous")) cfg.provider.continuous = p["continuous"].get<bool>();
        if (p.contains("interim_results")) cfg.provider.interim_results = p["interim_results"].get<bool>();
    }

    if (j.contains("providers")) {
        for (auto& [name, settings] : j["providers"].items()) {
            if (!parse_provider_type(name)) {
                std::println(stderr, "config: ignoring unknown provider '{}'", name);
                continue;
            }
            auto& dest = cfg.providers[name];
            for (auto& [key, value] : settings.items()) {
                if (value.is_null()) continue;
                dest[key] = option_string(value);
            }
        }
    }

    if (j.contains("audio")) {
        auto& a = j["audio"];
        if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
        if (a.contains("connect_timeout_ms")) cfg.audio.connect_timeout_ms = a["connect_timeout_ms"].get<uint32_t>();
        if (a.contains("buffer_seconds")) cfg.audio.buffer_seconds = a["buffer_seconds"].get<uint32_t>();
    }

    if (j.contains("streaming")) {
        auto& s = j["streaming"];
        if (s.contains("max_reconnect_attempts")) cfg.streaming.max_reconnect_attempts = s["max_reconnect_attempts"].get<int>();
        if (s.contains("reconnect_backoff_ms")) cfg.streaming.reconnect_backoff_ms = s["reconnect_backoff_ms"].get<uint32_t>();
        if (s.contains("flush_timeout_ms")) cfg.streaming.flush_timeout_ms = s["flush_timeout_ms"].get<uint32_t>();
        if (s.contains("keepalive_ms")) cfg.streaming.keepalive_ms = s["keepalive_ms"].get<uint32_t>();
    }

    return cfg;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return Config{};
    }

    try {
        return from_json(json::parse(f));
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
