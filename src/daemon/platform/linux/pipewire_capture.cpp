#include "platform/linux/pipewire_capture.hpp"

#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWireCapture::PipeWireCapture(RingBuffer& ring_buf)
    : ring_buf_(ring_buf) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    teardown();
    pw_deinit();
}

Result<void> PipeWireCapture::start_capture(const AudioSettings& settings) {
    if (capturing_.load(std::memory_order_relaxed)) {
        return std::unexpected(AudioError{"capture already running"});
    }

    ring_buf_.reset();

    loop_ = pw_thread_loop_new("voicekey", nullptr);
    if (!loop_) {
        return std::unexpected(AudioError{"failed to create PipeWire thread loop"});
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "voicekey",
        PW_KEY_APP_NAME, "voicekey",
        nullptr
    );
    if (!settings.device.empty() && settings.device != "default") {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, settings.device.c_str());
    }

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "voicekey-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        teardown();
        return std::unexpected(AudioError{"failed to create PipeWire stream"});
    }

    // S16_LE, mono, configured rate
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = settings.sample_rate,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    // Set before the stream can deliver its first buffer.
    capturing_.store(true, std::memory_order_release);

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
        teardown();
        return std::unexpected(AudioError{
            std::string("audio stream connect failed: ") + spa_strerror(ret)});
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        teardown();
        return std::unexpected(AudioError{
            std::string("audio thread loop start failed: ") + spa_strerror(ret)});
    }

    return {};
}

std::vector<int16_t> PipeWireCapture::stop_capture() {
    teardown();

    if (auto dropped = ring_buf_.dropped(); dropped > 0) {
        std::println(stderr, "audio: buffer full, dropped {} samples", dropped);
    }
    return ring_buf_.drain();
}

void PipeWireCapture::teardown() {
    capturing_.store(false, std::memory_order_release);

    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
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
    if (!d->data || !self->capturing_.load(std::memory_order_relaxed)) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = reinterpret_cast<const int16_t*>(
        static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    std::span<const int16_t> chunk(data, d->chunk->size / sizeof(int16_t));

    self->ring_buf_.push(chunk);
    if (self->observer_) self->observer_(chunk);

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* /*userdata*/, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}
