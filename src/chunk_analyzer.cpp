#include "chunkring/chunk_analyzer.hpp"

#include <fftw3.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace chunkring {

struct ChunkAnalyzer::FFTWData {
    fftwf_plan plan = nullptr;
    float* input = nullptr;           // FFTW-aligned input buffer
    fftwf_complex* output = nullptr;  // FFTW-aligned output buffer

    ~FFTWData() {
        if (plan != nullptr) {
            fftwf_destroy_plan(plan);
        }
        if (input != nullptr) {
            fftwf_free(input);
        }
        if (output != nullptr) {
            fftwf_free(output);
        }
    }
};

ChunkAnalyzer::ChunkAnalyzer(const AnalyzerConfig& config)
    : config_{config}, fftw_{std::make_unique<FFTWData>()} {
    const auto n = config_.chunk_size;
    if (n < 2 || (n & (n - 1)) != 0) {
        throw std::invalid_argument("Chunk size must be a power of two");
    }

    fftw_->input = fftwf_alloc_real(n);
    fftw_->output = fftwf_alloc_complex(bin_count());
    if (fftw_->input == nullptr || fftw_->output == nullptr) {
        throw std::runtime_error("Failed to allocate FFTW buffers");
    }

    fftw_->plan =
        fftwf_plan_dft_r2c_1d(static_cast<int>(n), fftw_->input, fftw_->output, FFTW_ESTIMATE);
    if (fftw_->plan == nullptr) {
        throw std::runtime_error("Failed to create FFTW plan");
    }

    constexpr auto pi = std::numbers::pi_v<float>;
    window_.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        const auto x = static_cast<float>(i) / static_cast<float>(n - 1);
        window_[i] = 0.5f * (1.0f - std::cos(2.0f * pi * x));
    }
}

ChunkAnalyzer::~ChunkAnalyzer() = default;

ChunkAnalyzer::ChunkAnalyzer(ChunkAnalyzer&& other) noexcept
    : config_{other.config_}, fftw_{std::move(other.fftw_)}, window_{std::move(other.window_)} {}

ChunkAnalyzer& ChunkAnalyzer::operator=(ChunkAnalyzer&& other) noexcept {
    if (this != &other) {
        config_ = other.config_;
        fftw_ = std::move(other.fftw_);
        window_ = std::move(other.window_);
    }
    return *this;
}

ChunkSummary ChunkAnalyzer::analyze(std::span<const float> chunk) {
    if (chunk.size() != config_.chunk_size) {
        throw std::invalid_argument("Chunk length must equal the analyzer chunk size");
    }

    ChunkSummary summary;

    const auto n = static_cast<float>(chunk.size());

    float sum = 0.0f;
    float sum_squares = 0.0f;
    for (const float sample : chunk) {
        sum += sample;
        sum_squares += sample * sample;
        summary.peak = std::max(summary.peak, std::abs(sample));
    }
    summary.rms = std::sqrt(sum_squares / n);

    // Remove DC first so its window leakage cannot outweigh a quiet tone
    const float mean = sum / n;
    for (std::size_t i = 0; i < chunk.size(); ++i) {
        fftw_->input[i] = (chunk[i] - mean) * window_[i];
    }

    fftwf_execute(fftw_->plan);

    // Strongest bin above DC; magnitudes compared squared
    std::size_t best_bin = 0;
    float best_power = 0.0f;
    for (std::size_t i = 1; i < bin_count(); ++i) {
        const float re = fftw_->output[i][0];
        const float im = fftw_->output[i][1];
        const float power = re * re + im * im;
        if (power > best_power) {
            best_power = power;
            best_bin = i;
        }
    }
    summary.dominant_frequency = bin_to_frequency(best_bin);

    return summary;
}

}  // namespace chunkring
