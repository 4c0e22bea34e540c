#include <gtest/gtest.h>
#include "utils/tail_buffer.h"

using namespace nanoflow::utils;

TEST(TailBufferTest, KeepsEverythingBelowCapacity) {
    TailBuffer buf(16);
    buf.append("hello ");
    buf.append("world");
    EXPECT_EQ(buf.str(), "hello world");
    EXPECT_EQ(buf.total_bytes(), 11);
    EXPECT_FALSE(buf.truncated());
}

TEST(TailBufferTest, KeepsLastBytesAcrossAppends) {
    TailBuffer buf(5);
    buf.append("abc");
    buf.append("defg");
    EXPECT_EQ(buf.str(), "cdefg");
    EXPECT_EQ(buf.size(), 5);
    EXPECT_EQ(buf.total_bytes(), 7);
    EXPECT_TRUE(buf.truncated());

    buf.append("h");
    EXPECT_EQ(buf.str(), "defgh");
}

TEST(TailBufferTest, SingleLargeAppend) {
    TailBuffer buf(4);
    buf.append("0123456789");
    EXPECT_EQ(buf.str(), "6789");
    EXPECT_EQ(buf.total_bytes(), 10);
}

TEST(TailBufferTest, BoundedUnderHeavyOutput) {
    TailBuffer buf(1024);
    std::string line(100, 'x');
    line += "\n";
    for (int i = 0; i < 10000; ++i) {
        buf.append(line);
    }
    buf.append("final error\n");
    EXPECT_EQ(buf.size(), 1024);
    EXPECT_EQ(buf.capacity(), 1024);
    auto s = buf.str();
    EXPECT_EQ(s.substr(s.size() - 12), "final error\n");
}

TEST(TailBufferTest, ZeroCapacityClampsToOne) {
    TailBuffer buf(0);
    buf.append("ab");
    EXPECT_EQ(buf.str(), "b");
}
