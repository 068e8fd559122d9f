#include "provider_registry.hpp"

#include <print>
#include <utility>
#include <vector>

ProviderRegistry::~ProviderRegistry() {
    cleanup();
}

void ProviderRegistry::register_constructor(ProviderType type, Constructor ctor) {
    std::lock_guard lock(mutex_);
    constructors_[type] = std::move(ctor);
}

bool ProviderRegistry::has_constructor(ProviderType type) const {
    std::lock_guard lock(mutex_);
    return constructors_.contains(type);
}

std::expected<std::shared_ptr<TranscriptionProvider>, Error>
ProviderRegistry::get_provider(const ProviderConfig& config) {
    std::lock_guard lock(mutex_);

    auto fingerprint = credential_fingerprint(config.credential);

    if (auto it = entries_.find(config.type); it != entries_.end()) {
        if (it->second.fingerprint == fingerprint) {
            return it->second.provider;
        }

        // Evict before teardown so the old instance is never handed out again.
        auto stale = std::move(it->second.provider);
        auto old_fingerprint = std::move(it->second.fingerprint);
        entries_.erase(it);
        std::println(stderr, "registry: credential changed for {}, replacing provider ({} -> {})",
                     provider_type_name(config.type), old_fingerprint, fingerprint);
        stale->cleanup();
    }

    auto ctor = constructors_.find(config.type);
    if (ctor == constructors_.end()) {
        return std::unexpected(Error{ErrorKind::UnsupportedProvider,
            std::string("no constructor registered for provider ") +
            std::string(provider_type_name(config.type))});
    }

    std::shared_ptr<TranscriptionProvider> provider = ctor->second(config);
    if (!provider) {
        return std::unexpected(Error{ErrorKind::UnsupportedProvider,
            std::string("provider ") + std::string(provider_type_name(config.type)) +
            " is not available in this build"});
    }

    if (auto res = provider->initialize(config.options); !res) {
        provider->cleanup();
        return std::unexpected(res.error());
    }

    entries_[config.type] = Entry{fingerprint, provider};
    return provider;
}

void ProviderRegistry::cleanup(std::optional<ProviderType> type) {
    std::lock_guard lock(mutex_);

    std::vector<std::shared_ptr<TranscriptionProvider>> doomed;
    if (type) {
        if (auto it = entries_.find(*type); it != entries_.end()) {
            doomed.push_back(std::move(it->second.provider));
            entries_.erase(it);
        }
    } else {
        for (auto& [t, entry] : entries_) {
            doomed.push_back(std::move(entry.provider));
        }
        entries_.clear();
    }

    for (auto& p : doomed) {
        p->cleanup();
    }
}

bool ProviderRegistry::is_cached(ProviderType type) const {
    std::lock_guard lock(mutex_);
    return entries_.contains(type);
}

size_t ProviderRegistry::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}
