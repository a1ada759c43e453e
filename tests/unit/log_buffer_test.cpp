#include <gtest/gtest.h>

#include <string>

#include "runtime/log_buffer.h"

using namespace lswitch;

TEST(LogBufferTest, DefaultsToTwoThousandLines) {
    LogBuffer buffer;
    EXPECT_EQ(buffer.capacity(), 2000u);
    EXPECT_TRUE(buffer.empty());
}

TEST(LogBufferTest, KeepsInsertionOrder) {
    LogBuffer buffer(4);
    buffer.append("a");
    buffer.append("b");
    buffer.append("c");

    EXPECT_EQ(buffer.snapshot(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(buffer.size(), 3u);
}

TEST(LogBufferTest, EvictsOldestWhenFull) {
    LogBuffer buffer;
    for (int i = 0; i < 2005; ++i) {
        buffer.append("line " + std::to_string(i));
    }

    auto lines = buffer.snapshot();
    ASSERT_EQ(lines.size(), 2000u);
    EXPECT_EQ(lines.front(), "line 5");
    EXPECT_EQ(lines.back(), "line 2004");
}

TEST(LogBufferTest, SnapshotIsDetached) {
    LogBuffer buffer(2);
    buffer.append("first");
    auto before = buffer.snapshot();
    buffer.append("second");
    buffer.append("third");

    EXPECT_EQ(before, (std::vector<std::string>{"first"}));
    EXPECT_EQ(buffer.snapshot(), (std::vector<std::string>{"second", "third"}));
}

TEST(LogBufferTest, ZeroCapacityKeepsLatestLine) {
    LogBuffer buffer(0);
    buffer.append("x");
    buffer.append("y");
    EXPECT_EQ(buffer.snapshot(), (std::vector<std::string>{"y"}));

    buffer.clear();
    EXPECT_TRUE(buffer.empty());
}
