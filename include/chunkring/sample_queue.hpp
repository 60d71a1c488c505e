#pragma once

#include "chunkring/chunked_ring_buffer.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>

namespace chunkring {

/// Counters describing how the producer side of a SampleQueue has fared.
struct QueueStats {
    std::uint64_t samples_pushed = 0;       // Samples accepted by push()
    std::uint64_t overwritten_samples = 0;  // Unread samples lost to overwrite
    std::uint64_t dropped_blocks = 0;       // Blocks rejected or skipped on contention
};

/// Chunked sample queue shared between one producer and one consumer thread.
///
/// ChunkedRingBuffer itself performs no synchronization; this class supplies it
/// with a mutex. The producer side never waits: if the consumer holds the lock
/// when push() is called, the block is dropped and counted instead. The
/// consumer side may wait briefly for a push in progress.
class SampleQueue {
public:
    /// Creates a queue that hands out chunks of `chunk_size` samples and holds
    /// up to `capacity_chunks` of them before overwriting.
    /// @throws std::invalid_argument for chunk_size <= 1, capacity_chunks == 0,
    ///         or a total capacity that does not fit in std::size_t.
    SampleQueue(std::size_t chunk_size, std::size_t capacity_chunks);

    SampleQueue(const SampleQueue&) = delete;
    SampleQueue& operator=(const SampleQueue&) = delete;

    /// Producer: stores `samples`, overwriting the oldest unread samples if needed.
    /// Never blocks and never allocates. Returns false if the block was dropped.
    bool push(std::span<const float> samples) noexcept;

    /// Consumer: moves the next chunk into `chunk`.
    /// Returns false if no complete chunk is buffered.
    /// @throws std::invalid_argument if chunk.size() != chunk_size().
    bool pop_chunk(std::span<float> chunk);

    [[nodiscard]] std::size_t chunks_available() const;
    [[nodiscard]] std::size_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// Discards everything buffered. Counters are kept.
    void clear();

    [[nodiscard]] QueueStats stats() const;

private:
    const std::size_t chunk_size_;
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    ChunkedRingBuffer<float> buffer_;
    QueueStats stats_;

    // Blocks skipped because the consumer held the lock; updated without it
    std::atomic<std::uint64_t> contended_blocks_{0};
};

}  // namespace chunkring
