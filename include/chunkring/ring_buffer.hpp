#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace chunkring {

/// Fixed-capacity ring buffer for streaming data.
///
/// Stores up to capacity() elements in one contiguous allocation and treats it
/// as circular. Writes never block: a write larger than the free space silently
/// overwrites the oldest unread elements, so a producer that outruns its
/// consumer loses old data rather than new data.
///
/// Two read idioms are offered. The value-returning read()/peek() overloads
/// throw std::out_of_range on misuse; the span-filling overloads return false
/// and leave the buffer untouched, for hot loops.
///
/// Thread safety: NOT thread-safe. One owner writes and reads; cross-thread use
/// must be synchronized by the caller (see SampleQueue).
///
/// Template parameter T must be trivially copyable (typically float for audio).
template <typename T>
    requires std::is_trivially_copyable_v<T>
class RingBuffer {
public:
    /// Constructs an empty buffer holding at most `capacity` elements.
    /// @throws std::invalid_argument if capacity is zero.
    explicit RingBuffer(std::size_t capacity)
        : capacity_{validate_capacity(capacity)}
        , buffer_{std::make_unique<T[]>(capacity_)} {}

    RingBuffer(const RingBuffer& other)
        : capacity_{other.capacity_}
        , buffer_{std::make_unique<T[]>(other.capacity_)}
        , start_{other.start_}
        , size_{other.size_} {
        std::copy_n(other.buffer_.get(), capacity_, buffer_.get());
    }

    RingBuffer& operator=(const RingBuffer& other) {
        if (this != &other) {
            RingBuffer copy{other};
            swap(copy);
        }
        return *this;
    }

    /// Takes over the storage of `other`, which is left with zero capacity:
    /// it reports nothing available and rejects every non-empty write.
    RingBuffer(RingBuffer&& other) noexcept
        : capacity_{std::exchange(other.capacity_, 0)}
        , buffer_{std::move(other.buffer_)}
        , start_{std::exchange(other.start_, 0)}
        , size_{std::exchange(other.size_, 0)} {}

    RingBuffer& operator=(RingBuffer&& other) noexcept {
        if (this != &other) {
            capacity_ = std::exchange(other.capacity_, 0);
            buffer_ = std::move(other.buffer_);
            start_ = std::exchange(other.start_, 0);
            size_ = std::exchange(other.size_, 0);
        }
        return *this;
    }

    /// Returns the maximum number of elements the buffer holds.
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// Number of elements currently readable.
    [[nodiscard]] std::size_t available() const noexcept { return size_; }

    /// Number of elements that can be written without overwriting unread data.
    [[nodiscard]] std::size_t free() const noexcept { return capacity_ - size_; }

    /// Returns true if nothing is readable.
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    /// Returns true if the next non-empty write overwrites unread data.
    [[nodiscard]] bool full() const noexcept { return size_ == capacity_; }

    /// Writes `data` after the last readable element, wrapping at the physical end.
    ///
    /// If `data` does not fit in free(), the oldest elements are overwritten and
    /// the read cursor moves past them. Returns false (no mutation) only when
    /// `data` is longer than capacity() and could never fit.
    bool write(std::span<const T> data) {
        const auto count = data.size();
        if (count > capacity_) {
            return false;
        }

        const auto end = wrap(start_ + size_);
        const auto first = std::min(count, capacity_ - end);
        std::copy_n(data.data(), first, buffer_.get() + end);
        std::copy_n(data.data() + first, count - first, buffer_.get());

        if (count > free()) {
            // Overrun: drop the oldest elements so the newest capacity_ remain.
            start_ = wrap(start_ + (size_ + count - capacity_));
            size_ = capacity_;
        } else {
            size_ += count;
        }
        return true;
    }

    /// Reads and consumes everything currently available.
    [[nodiscard]] std::vector<T> read() { return read(size_); }

    /// Reads and consumes `length` elements.
    /// @throws std::out_of_range if fewer than `length` elements are available.
    [[nodiscard]] std::vector<T> read(std::size_t length) {
        auto out = peek(length);
        skip(length);
        return out;
    }

    /// Reads and consumes exactly out.size() elements into `out`.
    /// Returns false (no mutation) if fewer are available.
    bool read(std::span<T> out) noexcept {
        if (!peek(out)) {
            return false;
        }
        skip(out.size());
        return true;
    }

    /// Returns a copy of everything available without consuming it.
    [[nodiscard]] std::vector<T> peek() const { return peek(size_); }

    /// Returns a copy of the next `length` elements without consuming them.
    /// @throws std::out_of_range if fewer than `length` elements are available.
    [[nodiscard]] std::vector<T> peek(std::size_t length) const {
        if (length > size_) {
            throw std::out_of_range("Not enough data available to read requested length");
        }

        std::vector<T> out(length);
        copy_out(out);
        return out;
    }

    /// Copies the next out.size() elements into `out` without consuming them.
    /// Returns false if fewer are available.
    bool peek(std::span<T> out) const noexcept {
        if (out.size() > size_) {
            return false;
        }
        copy_out(out);
        return true;
    }

    /// Consumes `count` elements without copying them, typically after peek().
    /// Skipping everything (or more) empties the buffer and rewinds both cursors.
    void skip(std::size_t count) noexcept {
        if (count >= size_) {
            clear();
            return;
        }
        start_ = wrap(start_ + count);
        size_ -= count;
    }

    /// Drops all readable data. Storage contents are left as they are.
    void clear() noexcept {
        start_ = 0;
        size_ = 0;
    }

    /// Exchanges storage and cursors with `other`.
    void swap(RingBuffer& other) noexcept {
        std::swap(capacity_, other.capacity_);
        std::swap(buffer_, other.buffer_);
        std::swap(start_, other.start_);
        std::swap(size_, other.size_);
    }

private:
    static std::size_t validate_capacity(std::size_t capacity) {
        if (capacity < 1) {
            throw std::invalid_argument("Capacity must be greater than 0");
        }
        return capacity;
    }

    /// Maps a logical index in [0, 2 * capacity) onto storage.
    [[nodiscard]] std::size_t wrap(std::size_t index) const noexcept {
        return index >= capacity_ ? index - capacity_ : index;
    }

    /// Copies out.size() elements from the read cursor; caller checks availability.
    void copy_out(std::span<T> out) const noexcept {
        const auto count = out.size();
        const auto first = std::min(count, capacity_ - start_);
        std::copy_n(buffer_.get() + start_, first, out.data());
        std::copy_n(buffer_.get(), count - first, out.data() + first);
    }

    std::size_t capacity_;
    std::unique_ptr<T[]> buffer_;

    std::size_t start_ = 0;  // Index of the oldest readable element
    std::size_t size_ = 0;   // Readable element count; end is wrap(start_ + size_)
};

template <typename T>
inline void swap(RingBuffer<T>& lhs, RingBuffer<T>& rhs) noexcept {
    lhs.swap(rhs);
}

}  // namespace chunkring
