#include "platform/linux/pipewire_capture.hpp"

#include <cerrno>
#include <ctime>
#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWireCapture::PipeWireCapture(uint32_t sample_rate, uint32_t connect_timeout_ms)
    : sample_rate_(sample_rate), connect_timeout_ms_(connect_timeout_ms) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    release();
    pw_deinit();
}

static Error stream_error(const std::string& message) {
    bool denied = message.find("ermission") != std::string::npos ||
                  message.find("not allowed") != std::string::npos;
    return Error{denied ? ErrorKind::PermissionDenied : ErrorKind::DeviceUnavailable,
                 "audio: " + message};
}

std::expected<void, Error> PipeWireCapture::acquire(FrameCallback on_frames) {
    if (acquired_.load(std::memory_order_acquire)) {
        return std::unexpected(Error{ErrorKind::InvalidState, "audio: stream already acquired"});
    }

    loop_ = pw_thread_loop_new("live-scribe", nullptr);
    if (!loop_) {
        return std::unexpected(Error{ErrorKind::DeviceUnavailable,
            "audio: failed to create thread loop"});
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "live-scribe",
        PW_KEY_APP_NAME, "live-scribe",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "live-scribe-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        int err = errno;
        destroy_stream();
        if (err == EACCES || err == EPERM) {
            return std::unexpected(Error{ErrorKind::PermissionDenied,
                "audio: access to PipeWire denied"});
        }
        return std::unexpected(Error{ErrorKind::DeviceUnavailable,
            "audio: failed to create stream (is PipeWire running?)"});
    }

    on_frames_ = std::move(on_frames);
    muted_.store(false, std::memory_order_release);
    state_ = PW_STREAM_STATE_UNCONNECTED;
    state_error_.clear();

    // S16_LE, mono, configured rate
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        destroy_stream();
        auto kind = (ret == -EACCES || ret == -EPERM) ? ErrorKind::PermissionDenied
                                                      : ErrorKind::DeviceUnavailable;
        return std::unexpected(Error{kind,
            std::string("audio: stream connect failed: ") + spa_strerror(ret)});
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        destroy_stream();
        return std::unexpected(Error{ErrorKind::DeviceUnavailable,
            std::string("audio: thread loop start failed: ") + spa_strerror(ret)});
    }

    if (auto res = wait_for_stream(); !res) {
        pw_thread_loop_stop(loop_);
        destroy_stream();
        return res;
    }

    acquired_.store(true, std::memory_order_release);
    return {};
}

std::expected<void, Error> PipeWireCapture::wait_for_stream() {
    pw_thread_loop_lock(loop_);

    timespec deadline;
    pw_thread_loop_get_time(loop_, &deadline,
                            static_cast<int64_t>(connect_timeout_ms_) * SPA_NSEC_PER_MSEC);

    std::expected<void, Error> result;
    while (true) {
        if (state_ == PW_STREAM_STATE_PAUSED || state_ == PW_STREAM_STATE_STREAMING) {
            break;
        }
        if (state_ == PW_STREAM_STATE_ERROR) {
            result = std::unexpected(stream_error(
                state_error_.empty() ? "stream error" : state_error_));
            break;
        }
        if (pw_thread_loop_timed_wait_full(loop_, &deadline) == -ETIMEDOUT) {
            result = std::unexpected(Error{ErrorKind::DeviceUnavailable,
                "audio: no capture device became available"});
            break;
        }
    }

    pw_thread_loop_unlock(loop_);
    return result;
}

void PipeWireCapture::release() {
    if (!loop_ && !stream_) return;

    acquired_.store(false, std::memory_order_release);
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    destroy_stream();
    on_frames_ = nullptr;
}

void PipeWireCapture::destroy_stream() {
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = reinterpret_cast<const int16_t*>(
        static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t count = d->chunk->size / sizeof(int16_t);

    if (!self->muted_.load(std::memory_order_relaxed) && self->on_frames_) {
        self->on_frames_({data, count});
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }

    // Runs on the loop thread with the loop lock held.
    self->state_ = state;
    if (error) self->state_error_ = error;
    pw_thread_loop_signal(self->loop_, false);
}
