#include <gtest/gtest.h>

#include <numeric>
#include <vector>

#include "PartBuffer.hpp"

TEST(PartBufferTest, AccumulatesAndResetsOnExtract) {
    PartBuffer buffer(8);
    std::vector<uint8_t> a{1, 2, 3};
    std::vector<uint8_t> b{4, 5};
    buffer.Append(a);
    buffer.Append(b);
    EXPECT_EQ(buffer.size(), 5U);

    auto part = buffer.Extract();
    EXPECT_EQ(part, (std::vector<uint8_t>{1, 2, 3, 4, 5}));
    EXPECT_TRUE(buffer.empty());

    buffer.Append(b);
    EXPECT_EQ(buffer.Extract(), b);
}

TEST(PartBufferTest, GrowsPastExpectedSize) {
    PartBuffer buffer(4);
    std::vector<uint8_t> big(10);
    std::iota(big.begin(), big.end(), 0);
    buffer.Append(big);
    buffer.Append(big);
    EXPECT_EQ(buffer.size(), 20U);

    auto part = buffer.Extract();
    ASSERT_EQ(part.size(), 20U);
    EXPECT_EQ(part[19], 9);
}

TEST(PartBufferTest, EmptyAppendIsANoOp) {
    PartBuffer buffer;
    buffer.Append({});
    EXPECT_TRUE(buffer.empty());
    EXPECT_TRUE(buffer.Extract().empty());
}

TEST(PartBufferTest, ReservesOnlyOnceDataArrives) {
    PartBuffer buffer(1024);
    EXPECT_EQ(buffer.capacity(), 0U);

    std::vector<uint8_t> chunk(100, 1);
    buffer.Append(chunk);
    EXPECT_GE(buffer.capacity(), 1024U);

    auto part = buffer.Extract();
    EXPECT_EQ(part.size(), 100U);
    EXPECT_EQ(buffer.capacity(), 0U);

    buffer.Append(chunk);
    EXPECT_GE(buffer.capacity(), 1024U);
}
