#pragma once

#include "../config.hpp"
#include "provider_registry.hpp"
#include "streaming_provider.hpp"

StreamingSettings streaming_settings(const Config& config);

// Installs a constructor for every backend compiled into this build.
void register_builtin_providers(ProviderRegistry& registry, const Config& config);
