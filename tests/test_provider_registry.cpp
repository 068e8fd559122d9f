#include <catch2/catch_test_macros.hpp>

#include "stt/provider_registry.hpp"
#include "test_doubles.hpp"

#include <memory>
#include <vector>

namespace {

// Keeps a raw view of every instance the registry builds.
struct Built {
    std::vector<FakeProvider*> instances;
    bool requires_credential = false;

    ProviderRegistry::Constructor ctor() {
        return [this](const ProviderConfig& cfg) -> std::unique_ptr<TranscriptionProvider> {
            auto p = std::make_unique<FakeProvider>(cfg.type, cfg.credential);
            p->requires_credential = requires_credential;
            instances.push_back(p.get());
            return p;
        };
    }
};

ProviderConfig config_for(ProviderType type, std::optional<std::string> key) {
    ProviderConfig c;
    c.type = type;
    c.credential = std::move(key);
    return c;
}

} // namespace

TEST_CASE("ProviderTypeNames", "[registry]") {
    REQUIRE(provider_type_name(ProviderType::Local) == "local");
    REQUIRE(provider_type_name(ProviderType::Deepgram) == "deepgram");
    REQUIRE(provider_type_name(ProviderType::AssemblyAI) == "assemblyai");
    REQUIRE(provider_type_name(ProviderType::RealtimeStt) == "realtimestt");

    REQUIRE(parse_provider_type("assemblyai") == ProviderType::AssemblyAI);
    REQUIRE_FALSE(parse_provider_type("webspeech").has_value());
    REQUIRE_FALSE(parse_provider_type("").has_value());
}

TEST_CASE("CredentialFingerprint", "[registry]") {
    auto a = credential_fingerprint(std::string("secret-key-a"));
    auto b = credential_fingerprint(std::string("secret-key-b"));

    REQUIRE(a == credential_fingerprint(std::string("secret-key-a")));
    REQUIRE(a != b);
    REQUIRE(a.find("secret") == std::string::npos);
    REQUIRE(credential_fingerprint(std::nullopt) == "nokey");
}

TEST_CASE("ProviderRegistry", "[registry]") {
    Built built;
    ProviderRegistry registry;
    registry.register_constructor(ProviderType::Deepgram, built.ctor());
    registry.register_constructor(ProviderType::AssemblyAI, built.ctor());

    SECTION("SameCredentialReturnsCachedInstance") {
        auto first = registry.get_provider(config_for(ProviderType::Deepgram, "k1"));
        auto second = registry.get_provider(config_for(ProviderType::Deepgram, "k1"));
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(first->get() == second->get());
        REQUIRE(built.instances.size() == 1);
        REQUIRE(built.instances[0]->initialize_calls == 1);
        REQUIRE(registry.is_cached(ProviderType::Deepgram));
    }

    SECTION("CredentialChangeReplacesInstance") {
        auto first = registry.get_provider(config_for(ProviderType::Deepgram, "k1"));
        REQUIRE(first.has_value());

        auto second = registry.get_provider(config_for(ProviderType::Deepgram, "k2"));
        REQUIRE(second.has_value());
        REQUIRE(first->get() != second->get());
        REQUIRE(built.instances.size() == 2);
        REQUIRE(built.instances[0]->cleanup_calls == 1);
        REQUIRE(built.instances[1]->cleanup_calls == 0);
        REQUIRE(registry.size() == 1);
    }

    SECTION("TypesAreCachedIndependently") {
        registry.get_provider(config_for(ProviderType::Deepgram, "k"));
        registry.get_provider(config_for(ProviderType::AssemblyAI, "k"));
        REQUIRE(registry.size() == 2);

        registry.cleanup(ProviderType::Deepgram);
        REQUIRE_FALSE(registry.is_cached(ProviderType::Deepgram));
        REQUIRE(registry.is_cached(ProviderType::AssemblyAI));
        REQUIRE(built.instances[0]->cleanup_calls == 1);
        REQUIRE(built.instances[1]->cleanup_calls == 0);
    }

    SECTION("CleanupAll") {
        registry.get_provider(config_for(ProviderType::Deepgram, "k"));
        registry.get_provider(config_for(ProviderType::AssemblyAI, "k"));

        registry.cleanup();
        REQUIRE(registry.size() == 0);
        for (auto* p : built.instances) {
            REQUIRE(p->cleanup_calls == 1);
        }

        // Cleaning an empty registry is harmless
        registry.cleanup();
        registry.cleanup(ProviderType::Local);
    }

    SECTION("CleanupThenGetBuildsFresh") {
        auto first = registry.get_provider(config_for(ProviderType::Deepgram, "k"));
        registry.cleanup(ProviderType::Deepgram);
        auto second = registry.get_provider(config_for(ProviderType::Deepgram, "k"));
        REQUIRE(first->get() != second->get());
    }

    SECTION("UnregisteredTypeIsUnsupported") {
        auto res = registry.get_provider(config_for(ProviderType::RealtimeStt, std::nullopt));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::UnsupportedProvider);
    }

    SECTION("NullConstructorIsUnsupported") {
        registry.register_constructor(ProviderType::Local,
            [](const ProviderConfig&) -> std::unique_ptr<TranscriptionProvider> { return nullptr; });
        auto res = registry.get_provider(config_for(ProviderType::Local, std::nullopt));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::UnsupportedProvider);
    }

    SECTION("InitializeFailureIsNotCached") {
        built.requires_credential = true;
        auto res = registry.get_provider(config_for(ProviderType::Deepgram, std::nullopt));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::Configuration);
        REQUIRE_FALSE(registry.is_cached(ProviderType::Deepgram));
        REQUIRE(built.instances[0]->cleanup_calls == 1);

        auto ok = registry.get_provider(config_for(ProviderType::Deepgram, "now-set"));
        REQUIRE(ok.has_value());
        REQUIRE(registry.is_cached(ProviderType::Deepgram));
    }

    SECTION("DestructorCleansUp") {
        Built other;
        std::shared_ptr<TranscriptionProvider> held;
        {
            ProviderRegistry scoped;
            scoped.register_constructor(ProviderType::Deepgram, other.ctor());
            auto res = scoped.get_provider(config_for(ProviderType::Deepgram, "k"));
            REQUIRE(res.has_value());
            held = *res;
        }
        REQUIRE(other.instances.size() == 1);
        REQUIRE(other.instances[0]->cleanup_calls == 1);
    }
}
