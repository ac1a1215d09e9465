#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

class PipeWireCapture : public AudioCapture {
public:
    explicit PipeWireCapture(RingBuffer& ring_buf);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    Result<void> start_capture(const AudioSettings& settings) override;
    std::vector<int16_t> stop_capture() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }
    // Must be set while not capturing.
    void set_chunk_observer(ChunkObserver observer) override { observer_ = std::move(observer); }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void teardown();

    RingBuffer& ring_buf_;
    ChunkObserver observer_;
    std::atomic<bool> capturing_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
