#include "chunkring/sample_queue.hpp"

#include <limits>
#include <stdexcept>

namespace chunkring {

namespace {

std::size_t queue_capacity(std::size_t chunk_size, std::size_t capacity_chunks) {
    if (capacity_chunks == 0) {
        throw std::invalid_argument("Sample queue must hold at least one chunk");
    }
    if (chunk_size != 0 && capacity_chunks > std::numeric_limits<std::size_t>::max() / chunk_size) {
        throw std::invalid_argument("Sample queue capacity overflows std::size_t");
    }
    return chunk_size * capacity_chunks;
}

}  // namespace

SampleQueue::SampleQueue(std::size_t chunk_size, std::size_t capacity_chunks)
    : chunk_size_{chunk_size}
    , capacity_{queue_capacity(chunk_size, capacity_chunks)}
    , buffer_{capacity_, chunk_size_} {}

bool SampleQueue::push(std::span<const float> samples) noexcept {
    std::unique_lock lock{mutex_, std::try_to_lock};
    if (!lock.owns_lock()) {
        // Consumer is mid-read; the audio thread must not wait for it.
        contended_blocks_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    const auto overwritten = samples.size() > buffer_.free() ? samples.size() - buffer_.free() : 0;
    if (!buffer_.write(samples)) {
        ++stats_.dropped_blocks;
        return false;
    }

    stats_.samples_pushed += samples.size();
    stats_.overwritten_samples += overwritten;
    return true;
}

bool SampleQueue::pop_chunk(std::span<float> chunk) {
    std::lock_guard lock{mutex_};
    return buffer_.read_chunk(chunk);
}

std::size_t SampleQueue::chunks_available() const {
    std::lock_guard lock{mutex_};
    return buffer_.chunks_available();
}

void SampleQueue::clear() {
    std::lock_guard lock{mutex_};
    buffer_.clear();
}

QueueStats SampleQueue::stats() const {
    std::lock_guard lock{mutex_};
    QueueStats stats = stats_;
    stats.dropped_blocks += contended_blocks_.load(std::memory_order_relaxed);
    return stats;
}

}  // namespace chunkring
