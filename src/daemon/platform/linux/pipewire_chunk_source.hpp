#pragma once

#include "audio/chunker.hpp"
#include "platform/audio_chunk_source.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <thread>

// Captures S16_LE audio from the default PipeWire source.
//
// The realtime process callback only writes into the ring buffer. A pump
// thread drains it every 100 ms into a Chunker and delivers finished chunks.
class PipeWireChunkSource : public AudioChunkSource {
public:
    explicit PipeWireChunkSource(bool verbose = false);
    ~PipeWireChunkSource() override;

    PipeWireChunkSource(const PipeWireChunkSource&) = delete;
    PipeWireChunkSource& operator=(const PipeWireChunkSource&) = delete;

    std::expected<void, std::string> start(const ChunkFormat& format, ChunkCallback on_chunk,
                                           ErrorCallback on_fatal) override;
    void stop() override;

    static constexpr auto kPumpInterval = std::chrono::milliseconds(100);

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void pump(std::stop_token st);
    void drain_into_chunker();
    void teardown_stream();
    void raise_fatal(std::string error);

    bool verbose_;
    std::atomic<bool> capturing_{false};
    std::atomic<bool> fatal_raised_{false};

    std::unique_ptr<RingBuffer> ring_;
    std::optional<Chunker> chunker_;
    std::vector<int16_t> scratch_;
    ChunkCallback on_chunk_;
    ErrorCallback on_fatal_;

    std::mutex pump_mu_;
    std::condition_variable_any pump_cv_;
    std::jthread pump_thread_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
