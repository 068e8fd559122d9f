#pragma once

#include "provider.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Builds, caches and tears down provider instances. At most one live
// instance per type; a credential change for a type replaces the instance.
class ProviderRegistry {
public:
    using Constructor =
        std::function<std::unique_ptr<TranscriptionProvider>(const ProviderConfig&)>;

    ProviderRegistry() = default;
    ~ProviderRegistry();

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    void register_constructor(ProviderType type, Constructor ctor);
    bool has_constructor(ProviderType type) const;

    std::expected<std::shared_ptr<TranscriptionProvider>, Error>
        get_provider(const ProviderConfig& config);

    // Tears down the cached entry for `type`, or every entry when empty.
    void cleanup(std::optional<ProviderType> type = std::nullopt);

    bool is_cached(ProviderType type) const;
    size_t size() const;

private:
    struct Entry {
        std::string fingerprint;
        std::shared_ptr<TranscriptionProvider> provider;
    };

    mutable std::mutex mutex_;
    std::map<ProviderType, Constructor> constructors_;
    std::map<ProviderType, Entry> entries_;
};
