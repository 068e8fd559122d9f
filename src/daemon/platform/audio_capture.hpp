#pragma once

#include "error.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <span>

// Exclusive microphone stream. Frames arrive on the capture thread.
class AudioCapture {
public:
    using FrameCallback = std::function<void(std::span<const int16_t>)>;

    virtual ~AudioCapture() = default;

    // PermissionDenied or DeviceUnavailable on failure.
    virtual std::expected<void, Error> acquire(FrameCallback on_frames) = 0;
    // A muted stream stays open but delivers nothing.
    virtual void set_muted(bool muted) = 0;
    virtual void release() = 0;
    virtual bool is_acquired() const = 0;
    virtual bool is_muted() const = 0;
};
