#include "platform/linux/pipewire_chunk_source.hpp"

#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

namespace {

// Seconds of audio the ring holds before the producer starts dropping.
constexpr double kRingSeconds = 10.0;

} // namespace

PipeWireChunkSource::PipeWireChunkSource(bool verbose)
    : verbose_(verbose) {
    pw_init(nullptr, nullptr);
}

PipeWireChunkSource::~PipeWireChunkSource() {
    stop();
    pw_deinit();
}

std::expected<void, std::string> PipeWireChunkSource::start(const ChunkFormat& format,
                                                            ChunkCallback on_chunk,
                                                            ErrorCallback on_fatal) {
    if (capturing_.load(std::memory_order_relaxed)) {
        return std::unexpected("capture already running");
    }

    ring_ = std::make_unique<RingBuffer>(
        static_cast<size_t>(kRingSeconds * format.sample_rate) * format.channels);
    chunker_.emplace(format);
    on_chunk_ = std::move(on_chunk);
    on_fatal_ = std::move(on_fatal);
    fatal_raised_.store(false, std::memory_order_relaxed);

    loop_ = pw_thread_loop_new("holdscribe", nullptr);
    if (!loop_) {
        return std::unexpected("failed to create thread loop");
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "holdscribe",
        PW_KEY_APP_NAME, "holdscribe",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "holdscribe-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        teardown_stream();
        return std::unexpected("failed to create stream");
    }

    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = format.sample_rate,
        .channels = format.channels
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    // capturing_ must be set before the stream can reach a state callback.
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
        capturing_.store(false, std::memory_order_release);
        teardown_stream();
        return std::unexpected(std::string("stream connect failed: ") + spa_strerror(ret));
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        capturing_.store(false, std::memory_order_release);
        teardown_stream();
        return std::unexpected(std::string("thread loop start failed: ") + spa_strerror(ret));
    }

    pump_thread_ = std::jthread([this](std::stop_token st) { pump(st); });

    if (verbose_) {
        std::println(stderr, "[holdscribe] Capture started ({} Hz, {} ch, {:.0f}s chunks)",
                     format.sample_rate, format.channels, format.chunk_seconds);
    }
    return {};
}

void PipeWireChunkSource::stop() {
    if (!capturing_.exchange(false, std::memory_order_acq_rel)) return;

    // No more producer writes once the loop is stopped.
    if (loop_) pw_thread_loop_stop(loop_);

    if (pump_thread_.joinable()) {
        pump_thread_.request_stop();
        pump_cv_.notify_all();
        pump_thread_.join();
    }

    drain_into_chunker();
    if (auto last = chunker_->flush()) {
        on_chunk_(std::move(*last));
    }

    if (ring_->dropped() > 0) {
        std::println(stderr, "audio: {} samples dropped (ring overflow)", ring_->dropped());
    }

    teardown_stream();
    on_chunk_ = nullptr;
    on_fatal_ = nullptr;
}

void PipeWireChunkSource::pump(std::stop_token st) {
    while (!st.stop_requested()) {
        {
            std::unique_lock lock(pump_mu_);
            pump_cv_.wait_for(lock, st, kPumpInterval, [] { return false; });
        }
        if (st.stop_requested()) break;
        drain_into_chunker();
    }
}

void PipeWireChunkSource::drain_into_chunker() {
    scratch_.clear();
    ring_->drain(scratch_);
    if (scratch_.empty()) return;

    for (auto& chunk : chunker_->push(scratch_)) {
        on_chunk_(std::move(chunk));
    }
}

void PipeWireChunkSource::teardown_stream() {
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireChunkSource::raise_fatal(std::string error) {
    if (fatal_raised_.exchange(true)) return;
    std::println(stderr, "audio: {}", error);
    if (on_fatal_) on_fatal_(std::move(error));
}

void PipeWireChunkSource::on_process(void* userdata) {
    auto* self = static_cast<PipeWireChunkSource*>(userdata);

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

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->ring_->write(data, count);
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireChunkSource::on_state_changed(void* userdata, enum pw_stream_state old,
                                           enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireChunkSource*>(userdata);

    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }

    if (!self->capturing_.load(std::memory_order_acquire)) return;

    // Losing the device shows up as an error or a drop back to unconnected.
    if (state == PW_STREAM_STATE_ERROR) {
        self->raise_fatal(std::string("stream error: ") + (error ? error : "unknown"));
    } else if (state == PW_STREAM_STATE_UNCONNECTED && old != PW_STREAM_STATE_UNCONNECTED) {
        self->raise_fatal("stream disconnected");
    }
}
