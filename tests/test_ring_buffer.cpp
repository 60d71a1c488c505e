#include "chunkring/ring_buffer.hpp"

#include <gtest/gtest.h>

#include <array>
#include <numeric>
#include <stdexcept>
#include <utility>
#include <vector>

namespace chunkring {
namespace {

class RingBufferTest : public ::testing::Test {
protected:
    static constexpr std::size_t kDefaultCapacity = 10;

    /// Returns {first, first + 1, ..., first + count - 1}.
    static std::vector<int> sequence(int first, std::size_t count) {
        std::vector<int> values(count);
        std::iota(values.begin(), values.end(), first);
        return values;
    }
};

TEST_F(RingBufferTest, RejectsZeroCapacity) {
    EXPECT_THROW(RingBuffer<int>{0}, std::invalid_argument);
}

TEST_F(RingBufferTest, InitiallyEmpty) {
    for (std::size_t capacity : {1u, 2u, 10u, 4096u}) {
        RingBuffer<int> buf{capacity};
        EXPECT_EQ(buf.capacity(), capacity);
        EXPECT_EQ(buf.available(), 0);
        EXPECT_EQ(buf.free(), capacity);
        EXPECT_TRUE(buf.empty());
        EXPECT_FALSE(buf.full());
    }
}

TEST_F(RingBufferTest, WriteReturnsTrueAndIncreasesAvailable) {
    RingBuffer<int> buf{kDefaultCapacity};
    EXPECT_TRUE(buf.write(sequence(1, 5)));
    EXPECT_EQ(buf.available(), 5);
    EXPECT_EQ(buf.free(), 5);
}

TEST_F(RingBufferTest, ReadReturnsWrittenData) {
    RingBuffer<int> buf{kDefaultCapacity};
    const auto data = sequence(1, 5);
    buf.write(data);

    EXPECT_EQ(buf.read(), data);
    EXPECT_TRUE(buf.empty());
}

TEST_F(RingBufferTest, ReadOfEmptyBufferIsEmpty) {
    RingBuffer<int> buf{kDefaultCapacity};
    EXPECT_TRUE(buf.read().empty());
    EXPECT_TRUE(buf.peek().empty());
}

TEST_F(RingBufferTest, ReadsWhatIsWrittenSequentially) {
    RingBuffer<int> buf{kDefaultCapacity};

    for (int block = 0; block < 4; ++block) {
        const auto data = sequence(1 + 3 * block, 3);
        buf.write(data);
        EXPECT_EQ(buf.read(), data);
    }
}

TEST_F(RingBufferTest, CapacityOneKeepsLatestValue) {
    RingBuffer<int> buf{1};
    buf.write(std::vector<int>{1});
    buf.write(std::vector<int>{2});

    EXPECT_EQ(buf.read(), std::vector<int>{2});
}

TEST_F(RingBufferTest, WriteLargerThanCapacityFailsWithoutMutation) {
    RingBuffer<int> buf{5};
    buf.write(sequence(1, 2));

    EXPECT_FALSE(buf.write(sequence(10, 6)));
    EXPECT_EQ(buf.available(), 2);
    EXPECT_EQ(buf.read(), sequence(1, 2));
}

TEST_F(RingBufferTest, WriteOfExactlyCapacityFillsBuffer) {
    RingBuffer<int> buf{kDefaultCapacity};
    const auto data = sequence(1, kDefaultCapacity);

    EXPECT_TRUE(buf.write(data));
    EXPECT_TRUE(buf.full());
    EXPECT_EQ(buf.available(), kDefaultCapacity);
    EXPECT_EQ(buf.free(), 0);
    EXPECT_EQ(buf.read(), data);
}

TEST_F(RingBufferTest, EmptyWriteSucceedsAndChangesNothing) {
    RingBuffer<int> buf{kDefaultCapacity};
    buf.write(sequence(1, 3));

    EXPECT_TRUE(buf.write(std::vector<int>{}));
    EXPECT_EQ(buf.available(), 3);
}

TEST_F(RingBufferTest, WrapsAroundCorrectly) {
    RingBuffer<int> buf{kDefaultCapacity};

    // Move both cursors past the midpoint
    buf.write(sequence(1, 5));
    EXPECT_EQ(buf.read(5), sequence(1, 5));

    // Straddles the physical end of storage
    const auto data = sequence(100, 6);
    EXPECT_TRUE(buf.write(data));
    EXPECT_EQ(buf.available(), 6);
    EXPECT_EQ(buf.read(6), data);
    EXPECT_TRUE(buf.empty());
}

TEST_F(RingBufferTest, WrappedSpanReadCopiesBothSegments) {
    RingBuffer<int> buf{kDefaultCapacity};
    buf.write(sequence(0, 8));
    buf.skip(7);
    buf.write(sequence(8, 6));  // Occupies indices 7..9 and 0..3

    std::array<int, 7> out{};
    EXPECT_TRUE(buf.read(out));
    EXPECT_EQ(std::vector<int>(out.begin(), out.end()), sequence(7, 7));
    EXPECT_TRUE(buf.empty());
}

TEST_F(RingBufferTest, OverflowingWriteDropsOldestData) {
    RingBuffer<int> buf{5};
    buf.write(sequence(1, 4));

    // Three new values only have room for one: 1 and 2 are overwritten
    EXPECT_TRUE(buf.write(sequence(5, 3)));
    EXPECT_TRUE(buf.full());
    EXPECT_EQ(buf.read(), sequence(3, 5));
}

TEST_F(RingBufferTest, RepeatedOverflowKeepsNewestInOrder) {
    RingBuffer<int> buf{4};
    for (int i = 0; i < 10; ++i) {
        buf.write(sequence(i * 3, 3));
    }

    EXPECT_EQ(buf.available(), 4);
    EXPECT_EQ(buf.read(), sequence(26, 4));
}

TEST_F(RingBufferTest, ReadMoreThanAvailableThrows) {
    RingBuffer<int> buf{kDefaultCapacity};
    EXPECT_THROW(static_cast<void>(buf.read(11)), std::out_of_range);

    buf.write(sequence(1, 3));
    EXPECT_THROW(static_cast<void>(buf.read(4)), std::out_of_range);
    EXPECT_EQ(buf.available(), 3);
}

TEST_F(RingBufferTest, PeekMoreThanAvailableThrows) {
    RingBuffer<int> buf{kDefaultCapacity};
    buf.write(sequence(1, 3));
    EXPECT_THROW(static_cast<void>(buf.peek(4)), std::out_of_range);
}

TEST_F(RingBufferTest, SpanReadMoreThanAvailableReturnsFalse) {
    RingBuffer<int> buf{kDefaultCapacity};
    buf.write(sequence(1, 5));

    std::array<int, 6> out{};
    EXPECT_FALSE(buf.read(out));
    EXPECT_EQ(buf.available(), 5);

    std::array<int, 6> untouched{};
    EXPECT_EQ(out, untouched);
}

TEST_F(RingBufferTest, SpanReadConsumes) {
    RingBuffer<int> buf{kDefaultCapacity};
    buf.write(sequence(1, 5));

    std::array<int, 5> out{};
    EXPECT_TRUE(buf.read(out));
    EXPECT_EQ(out, (std::array<int, 5>{1, 2, 3, 4, 5}));
    EXPECT_TRUE(buf.empty());
}

TEST_F(RingBufferTest, PeekDoesNotConsume) {
    RingBuffer<int> buf{kDefaultCapacity};
    buf.write(sequence(1, 5));

    const auto first = buf.peek();
    const auto second = buf.peek();
    EXPECT_EQ(first, sequence(1, 5));
    EXPECT_EQ(first, second);
    EXPECT_EQ(buf.available(), 5);

    EXPECT_EQ(buf.peek(2), sequence(1, 2));
    EXPECT_EQ(buf.available(), 5);
}

TEST_F(RingBufferTest, SpanPeekDoesNotConsume) {
    RingBuffer<int> buf{kDefaultCapacity};
    buf.write(sequence(1, 5));

    std::array<int, 3> out{};
    EXPECT_TRUE(buf.peek(out));
    EXPECT_EQ(out, (std::array<int, 3>{1, 2, 3}));
    EXPECT_TRUE(buf.peek(out));
    EXPECT_EQ(out, (std::array<int, 3>{1, 2, 3}));
    EXPECT_EQ(buf.available(), 5);

    std::array<int, 6> too_long{};
    EXPECT_FALSE(buf.peek(too_long));
}

TEST_F(RingBufferTest, SkipAfterPeekConsumes) {
    RingBuffer<int> buf{kDefaultCapacity};
    buf.write(sequence(1, 6));

    EXPECT_EQ(buf.peek(4), sequence(1, 4));
    buf.skip(4);

    EXPECT_EQ(buf.available(), 2);
    EXPECT_EQ(buf.read(), sequence(5, 2));
}

TEST_F(RingBufferTest, SkipPastAvailableEmptiesBuffer) {
    RingBuffer<int> buf{kDefaultCapacity};
    buf.write(sequence(1, 8));
    buf.skip(6);
    buf.write(sequence(9, 5));  // Wrapped: 7..13 readable

    buf.skip(25);
    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.free(), kDefaultCapacity);

    // Cursors were rewound, so a full-capacity write lands contiguously
    const auto data = sequence(50, kDefaultCapacity);
    EXPECT_TRUE(buf.write(data));
    EXPECT_EQ(buf.read(), data);
}

TEST_F(RingBufferTest, ClearDropsData) {
    RingBuffer<int> buf{kDefaultCapacity};
    buf.write(sequence(1, 7));

    buf.clear();
    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.free(), kDefaultCapacity);
}

TEST_F(RingBufferTest, CopyIsIndependent) {
    RingBuffer<int> buf{kDefaultCapacity};
    buf.write(sequence(1, 4));

    RingBuffer<int> copy{buf};
    EXPECT_EQ(buf.read(), sequence(1, 4));
    EXPECT_EQ(copy.available(), 4);
    EXPECT_EQ(copy.read(), sequence(1, 4));
}

TEST_F(RingBufferTest, MovedFromBufferIsEmpty) {
    RingBuffer<int> source{4};
    source.write(sequence(1, 3));

    RingBuffer<int> target{std::move(source)};
    EXPECT_EQ(target.capacity(), 4);
    EXPECT_EQ(target.read(), sequence(1, 3));

    EXPECT_EQ(source.capacity(), 0);
    EXPECT_EQ(source.available(), 0);
    EXPECT_TRUE(source.peek().empty());
    EXPECT_THROW(static_cast<void>(source.read(1)), std::out_of_range);
    EXPECT_FALSE(source.write(sequence(1, 1)));

    std::array<int, 1> out{};
    EXPECT_FALSE(source.read(out));
    EXPECT_FALSE(source.peek(out));
}

TEST_F(RingBufferTest, MoveAssignmentEmptiesSource) {
    RingBuffer<int> source{kDefaultCapacity};
    source.write(sequence(1, 5));
    RingBuffer<int> target{2};

    target = std::move(source);
    EXPECT_EQ(target.capacity(), kDefaultCapacity);
    EXPECT_EQ(target.read(), sequence(1, 5));
    EXPECT_EQ(source.available(), 0);
    EXPECT_FALSE(source.write(sequence(1, 1)));

    // Assigning storage back makes the source usable again
    source = std::move(target);
    EXPECT_TRUE(source.write(sequence(7, 2)));
    EXPECT_EQ(source.read(), sequence(7, 2));
}

TEST_F(RingBufferTest, WorksWithFloatSamples) {
    RingBuffer<float> buf{4};
    const std::array<float, 3> samples = {0.25f, -0.5f, 1.0f};
    buf.write(samples);
    buf.write(samples);

    const auto out = buf.read();
    ASSERT_EQ(out.size(), 4);
    EXPECT_FLOAT_EQ(out[0], 1.0f);
    EXPECT_FLOAT_EQ(out[1], 0.25f);
    EXPECT_FLOAT_EQ(out[2], -0.5f);
    EXPECT_FLOAT_EQ(out[3], 1.0f);
}

}  // namespace
}  // namespace chunkring
