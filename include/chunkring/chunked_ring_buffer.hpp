#pragma once

#include "chunkring/ring_buffer.hpp"

#include <cstddef>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace chunkring {

/// Ring buffer that hands out data only in whole chunks of chunk_size() elements.
///
/// Writes behave exactly like RingBuffer::write (including overwrite on
/// overflow). Reads and peeks succeed only when at least one complete chunk
/// sits between the read cursor and the newest element; partial chunks stay
/// buffered until enough data arrives. Chunk boundaries are not stored, they
/// are counted from the current read cursor.
///
/// Thread safety: NOT thread-safe, same as RingBuffer.
template <typename T>
    requires std::is_trivially_copyable_v<T>
class ChunkedRingBuffer {
public:
    /// @throws std::invalid_argument if capacity <= 1, chunk_size <= 1,
    ///         or chunk_size > capacity.
    ChunkedRingBuffer(std::size_t capacity, std::size_t chunk_size)
        : buffer_{validate(capacity, chunk_size)}, chunk_size_{chunk_size} {}

    [[nodiscard]] std::size_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.capacity(); }
    [[nodiscard]] std::size_t available() const noexcept { return buffer_.available(); }
    [[nodiscard]] std::size_t free() const noexcept { return buffer_.free(); }

    /// Number of complete chunks ready to be read.
    [[nodiscard]] std::size_t chunks_available() const noexcept {
        return buffer_.available() / chunk_size_;
    }

    [[nodiscard]] bool can_read_chunk() const noexcept { return chunks_available() > 0; }

    /// See RingBuffer::write.
    bool write(std::span<const T> data) { return buffer_.write(data); }

    /// Reads and consumes the next chunk.
    /// @throws std::out_of_range if no complete chunk is available.
    [[nodiscard]] std::vector<T> read_chunk() {
        if (!can_read_chunk()) {
            throw std::out_of_range("No chunks available to read");
        }
        return buffer_.read(chunk_size_);
    }

    /// Reads and consumes the next chunk into `chunk`.
    /// Returns false (no mutation) if no complete chunk is available.
    /// @throws std::invalid_argument if chunk.size() != chunk_size().
    bool read_chunk(std::span<T> chunk) {
        check_chunk_span(chunk);
        if (!can_read_chunk()) {
            return false;
        }
        return buffer_.read(chunk);
    }

    /// Returns the next chunk without consuming it.
    /// @throws std::out_of_range if no complete chunk is available.
    [[nodiscard]] std::vector<T> peek_chunk() const {
        if (!can_read_chunk()) {
            throw std::out_of_range("No chunks available to peek");
        }
        return buffer_.peek(chunk_size_);
    }

    /// Copies the next chunk into `chunk` without consuming it.
    /// Returns false if no complete chunk is available.
    /// @throws std::invalid_argument if chunk.size() != chunk_size().
    bool peek_chunk(std::span<T> chunk) const {
        check_chunk_span(chunk);
        if (!can_read_chunk()) {
            return false;
        }
        return buffer_.peek(chunk);
    }

    /// Consumes the next chunk without copying it, typically after peek_chunk().
    /// Returns false if no complete chunk is available.
    bool skip_chunk() noexcept {
        if (!can_read_chunk()) {
            return false;
        }
        buffer_.skip(chunk_size_);
        return true;
    }

    void clear() noexcept { buffer_.clear(); }

    /// Underlying element buffer, for inspection.
    [[nodiscard]] const RingBuffer<T>& buffer() const noexcept { return buffer_; }

private:
    static std::size_t validate(std::size_t capacity, std::size_t chunk_size) {
        if (capacity <= 1) {
            throw std::invalid_argument("Capacity must be greater than 1");
        }
        if (chunk_size <= 1) {
            throw std::invalid_argument("Chunk size must be greater than 1");
        }
        if (chunk_size > capacity) {
            throw std::invalid_argument("Chunk size must be less than or equal to capacity");
        }
        return capacity;
    }

    void check_chunk_span(std::span<const T> chunk) const {
        if (chunk.size() != chunk_size_) {
            throw std::invalid_argument(
                "Chunk span length must be equal to the chunk size of the buffer");
        }
    }

    RingBuffer<T> buffer_;
    std::size_t chunk_size_;
};

}  // namespace chunkring
