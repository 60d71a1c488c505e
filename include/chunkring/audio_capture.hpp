#pragma once

#include "chunkring/sample_queue.hpp"

#include <portaudio.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace chunkring {

/// RAII guard for PortAudio library initialization.
/// Pa_Initialize/Pa_Terminate run once for the first and last live guard.
class PortAudioGuard {
public:
    PortAudioGuard();
    ~PortAudioGuard();

    PortAudioGuard(const PortAudioGuard&) = delete;
    PortAudioGuard& operator=(const PortAudioGuard&) = delete;

private:
    static std::atomic<int> ref_count_;
};

/// Audio capture configuration.
struct CaptureConfig {
    std::uint32_t sample_rate = 48000;    // Samples per second
    std::uint32_t buffer_frames = 256;    // Frames per callback (latency tradeoff)
    std::uint32_t channels = 1;           // Interleaved channels per frame
    std::size_t chunk_frames = 1024;      // Frames handed to the consumer at once
    std::size_t history_chunks = 8;       // Chunks buffered before overwriting
};

/// Capture statistics for monitoring.
struct CaptureStats {
    std::uint64_t callback_count = 0;
    std::uint64_t input_overflows = 0;    // Reported by PortAudio before reaching us
    QueueStats queue;
};

/// Captures the default input device via PortAudio into a chunked queue.
///
/// The PortAudio callback runs on a real-time thread and only calls
/// SampleQueue::push, which neither blocks nor allocates. The consumer pulls
/// whole chunks of chunk_size() interleaved samples with read_chunk().
class AudioCapture {
public:
    /// Opens the default input device.
    /// @throws std::runtime_error on any PortAudio failure.
    /// @throws std::invalid_argument if the chunk geometry is invalid.
    explicit AudioCapture(const CaptureConfig& config = {});

    /// Stops capture and closes the stream.
    ~AudioCapture();

    // Non-copyable, non-movable (PortAudio holds a pointer to this)
    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;
    AudioCapture(AudioCapture&&) = delete;
    AudioCapture& operator=(AudioCapture&&) = delete;

    /// Starts capture. Idempotent if already running.
    void start();

    /// Stops capture. Idempotent if already stopped.
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(std::memory_order_relaxed); }

    [[nodiscard]] std::uint32_t sample_rate() const noexcept { return config_.sample_rate; }
    [[nodiscard]] std::uint32_t channels() const noexcept { return config_.channels; }

    /// Samples per chunk (chunk_frames * channels).
    [[nodiscard]] std::size_t chunk_size() const noexcept { return queue_.chunk_size(); }

    /// Moves the next captured chunk into `chunk`. Returns false if none is ready.
    /// @throws std::invalid_argument if chunk.size() != chunk_size().
    bool read_chunk(std::span<float> chunk) { return queue_.pop_chunk(chunk); }

    [[nodiscard]] std::size_t chunks_available() const { return queue_.chunks_available(); }

    [[nodiscard]] CaptureStats stats() const;

    [[nodiscard]] const std::string& device_name() const noexcept { return device_name_; }

    /// Lists available input devices.
    [[nodiscard]] static std::vector<std::string> list_input_devices();

private:
    static int audio_callback(
        const void* input,
        void* output,
        unsigned long frame_count,
        const PaStreamCallbackTimeInfo* time_info,
        PaStreamCallbackFlags status_flags,
        void* user_data
    );

    PortAudioGuard portaudio_;  // Declared first: outlives stream_
    CaptureConfig config_;
    std::string device_name_;
    SampleQueue queue_;

    PaStream* stream_ = nullptr;
    std::atomic<bool> running_{false};

    std::atomic<std::uint64_t> callback_count_{0};
    std::atomic<std::uint64_t> input_overflows_{0};
};

}  // namespace chunkring
