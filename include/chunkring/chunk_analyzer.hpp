#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

namespace chunkring {

/// Configuration for per-chunk analysis.
struct AnalyzerConfig {
    std::size_t chunk_size = 1024;        // Samples per chunk; must be a power of two
    float sample_rate = 48000.0f;         // Used to convert bins to Hz
};

/// Level and pitch figures for one chunk.
struct ChunkSummary {
    float rms = 0.0f;
    float peak = 0.0f;                    // Largest absolute sample value
    float dominant_frequency = 0.0f;      // Hz of the strongest non-DC bin, 0 for silence
};

/// Summarizes fixed-size audio chunks: RMS, peak and dominant frequency.
///
/// Owns an FFTW real-to-complex plan sized to the chunk, plus a Hann window,
/// so analyze() does not allocate.
///
/// Thread safety: NOT thread-safe. Use one instance per consumer thread.
class ChunkAnalyzer {
public:
    /// @throws std::invalid_argument if chunk_size is not a power of two >= 2.
    /// @throws std::runtime_error if FFTW cannot allocate or plan.
    explicit ChunkAnalyzer(const AnalyzerConfig& config = {});

    ~ChunkAnalyzer();

    ChunkAnalyzer(const ChunkAnalyzer&) = delete;
    ChunkAnalyzer& operator=(const ChunkAnalyzer&) = delete;

    ChunkAnalyzer(ChunkAnalyzer&& other) noexcept;
    ChunkAnalyzer& operator=(ChunkAnalyzer&& other) noexcept;

    /// @throws std::invalid_argument if chunk.size() != chunk_size().
    [[nodiscard]] ChunkSummary analyze(std::span<const float> chunk);

    [[nodiscard]] std::size_t chunk_size() const noexcept { return config_.chunk_size; }

    /// Number of spectrum bins (chunk_size / 2 + 1).
    [[nodiscard]] std::size_t bin_count() const noexcept { return config_.chunk_size / 2 + 1; }

    [[nodiscard]] float bin_to_frequency(std::size_t bin_index) const noexcept {
        return static_cast<float>(bin_index) * config_.sample_rate /
               static_cast<float>(config_.chunk_size);
    }

    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

private:
    AnalyzerConfig config_;

    // FFTW resources (opaque to keep fftw3.h out of this header)
    struct FFTWData;
    std::unique_ptr<FFTWData> fftw_;

    std::vector<float> window_;
};

}  // namespace chunkring
