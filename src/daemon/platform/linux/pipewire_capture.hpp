#pragma once

#include "platform/audio_capture.hpp"

#include <atomic>
#include <cstdint>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>

class PipeWireCapture : public AudioCapture {
public:
    explicit PipeWireCapture(uint32_t sample_rate = 16000, uint32_t connect_timeout_ms = 3000);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    std::expected<void, Error> acquire(FrameCallback on_frames) override;
    void set_muted(bool muted) override { muted_.store(muted, std::memory_order_release); }
    void release() override;
    bool is_acquired() const override { return acquired_.load(std::memory_order_acquire); }
    bool is_muted() const override { return muted_.load(std::memory_order_acquire); }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    std::expected<void, Error> wait_for_stream();
    void destroy_stream();

    uint32_t sample_rate_;
    uint32_t connect_timeout_ms_;
    FrameCallback on_frames_;
    std::atomic<bool> acquired_{false};
    std::atomic<bool> muted_{false};

    // Guarded by the thread loop lock.
    pw_stream_state state_ = PW_STREAM_STATE_UNCONNECTED;
    std::string state_error_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
