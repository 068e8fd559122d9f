#include "provider.hpp"

#include <format>

std::string_view provider_type_name(ProviderType type) {
    switch (type) {
        case ProviderType::Local: return "local";
        case ProviderType::Deepgram: return "deepgram";
        case ProviderType::AssemblyAI: return "assemblyai";
        case ProviderType::RealtimeStt: return "realtimestt";
    }
    return "unknown";
}

std::optional<ProviderType> parse_provider_type(std::string_view name) {
    if (name == "local") return ProviderType::Local;
    if (name == "deepgram") return ProviderType::Deepgram;
    if (name == "assemblyai") return ProviderType::AssemblyAI;
    if (name == "realtimestt") return ProviderType::RealtimeStt;
    return std::nullopt;
}

std::string credential_fingerprint(const std::optional<std::string>& credential) {
    if (!credential || credential->empty()) return "nokey";

    // FNV-1a, 64 bit
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : *credential) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return std::format("{:016x}", hash);
}

std::string_view severity_name(BackendNotice::Severity severity) {
    switch (severity) {
        case BackendNotice::Severity::Transient: return "transient";
        case BackendNotice::Severity::Degraded: return "degraded";
        case BackendNotice::Severity::Restored: return "restored";
        case BackendNotice::Severity::Fatal: return "fatal";
    }
    return "unknown";
}
