#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "ls_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

// Sets an environment variable for the lifetime of the guard.
struct EnvGuard {
    std::string name;

    EnvGuard(const std::string& n, const char* value) : name(n) {
        if (value) ::setenv(name.c_str(), value, 1);
        else ::unsetenv(name.c_str());
    }
    ~EnvGuard() { ::unsetenv(name.c_str()); }
};

} // namespace

TEST_CASE("Config", "[config]") {
    EnvGuard no_deepgram("DEEPGRAM_API_KEY", nullptr);
    EnvGuard no_assembly("ASSEMBLYAI_API_KEY", nullptr);

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.provider.type == "deepgram");
        REQUIRE(cfg.provider.language == "en-US");
        REQUIRE(cfg.provider.continuous);
        REQUIRE(cfg.provider.interim_results);
        REQUIRE(cfg.providers.empty());
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.connect_timeout_ms == 3000);
        REQUIRE(cfg.streaming.max_reconnect_attempts == 3);
        REQUIRE(cfg.streaming.reconnect_backoff_ms == 500);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "provider": {
                "type": "assemblyai",
                "language": "de-DE",
                "continuous": false,
                "interim_results": false
            },
            "providers": {
                "assemblyai": { "credential": "aai-secret" },
                "local": { "model_path": "/models/ggml-base.en.bin", "threads": 4 },
                "realtimestt": { "url": "ws://10.0.0.5:8012" }
            },
            "audio": { "sample_rate": 48000, "connect_timeout_ms": 1000, "buffer_seconds": 10 },
            "streaming": {
                "max_reconnect_attempts": 5,
                "reconnect_backoff_ms": 250,
                "flush_timeout_ms": 2000,
                "keepalive_ms": 8000
            }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.provider.type == "assemblyai");
        REQUIRE(cfg.provider.language == "de-DE");
        REQUIRE_FALSE(cfg.provider.continuous);
        REQUIRE_FALSE(cfg.provider.interim_results);
        REQUIRE(cfg.audio.sample_rate == 48000);
        REQUIRE(cfg.audio.connect_timeout_ms == 1000);
        REQUIRE(cfg.audio.buffer_seconds == 10);
        REQUIRE(cfg.streaming.max_reconnect_attempts == 5);
        REQUIRE(cfg.streaming.reconnect_backoff_ms == 250);
        REQUIRE(cfg.streaming.flush_timeout_ms == 2000);
        REQUIRE(cfg.streaming.keepalive_ms == 8000);

        // Numbers are passed through as option strings
        REQUIRE(cfg.providers["local"]["threads"] == "4");
        REQUIRE(cfg.providers["realtimestt"]["url"] == "ws://10.0.0.5:8012");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "provider": { "language": "fr-FR" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.provider.language == "fr-FR");
        // Other fields retain defaults
        REQUIRE(cfg.provider.type == "deepgram");
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.streaming.flush_timeout_ms == 3000);
    }

    SECTION("UnknownProviderIgnored") {
        auto cfg = Config::from_json(nlohmann::json::parse(
            R"({ "providers": { "webspeech": { "x": "y" }, "deepgram": { "model": "nova-3" } } })"));
        REQUIRE(cfg.providers.size() == 1);
        REQUIRE(cfg.providers.contains("deepgram"));
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.provider.type == "deepgram");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadWrongTypes") {
        TmpFile f(R"({ "audio": { "sample_rate": "fast" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/ls_test_nonexistent_config_file.json");
        REQUIRE(cfg.provider.type == "deepgram");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("ProviderConfigSplitsCredential") {
        Config cfg;
        cfg.provider.language = "es-ES";
        cfg.providers["deepgram"] = {{"credential", "dg-key"}, {"model", "nova-3"}};

        auto pc = cfg.provider_config(ProviderType::Deepgram);
        REQUIRE(pc.type == ProviderType::Deepgram);
        REQUIRE(pc.credential == std::optional<std::string>("dg-key"));
        REQUIRE(pc.options.language == "es-ES");
        REQUIRE(pc.options.sample_rate == 16000);
        REQUIRE(pc.options.extra.size() == 1);
        REQUIRE(pc.options.extra_or("model", "") == "nova-3");
        REQUIRE_FALSE(pc.options.extra.contains("credential"));
    }

    SECTION("CredentialFromEnvironment") {
        Config cfg;
        REQUIRE_FALSE(cfg.provider_config(ProviderType::AssemblyAI).credential.has_value());

        EnvGuard key("ASSEMBLYAI_API_KEY", "env-key");
        REQUIRE(cfg.provider_config(ProviderType::AssemblyAI).credential ==
                std::optional<std::string>("env-key"));

        // File credential wins over the environment
        cfg.set_credential(ProviderType::AssemblyAI, "file-key");
        REQUIRE(cfg.provider_config(ProviderType::AssemblyAI).credential ==
                std::optional<std::string>("file-key"));
    }

    SECTION("LocalProviderHasNoCredential") {
        Config cfg;
        auto pc = cfg.provider_config(ProviderType::Local);
        REQUIRE_FALSE(pc.credential.has_value());
    }
}
