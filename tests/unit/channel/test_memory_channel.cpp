/**
 * @file test_memory_channel.cpp
 * @brief Unit tests for the in-process channel
 */

#include <gtest/gtest.h>

#include <clipxfer/channel/memory_channel.h>

#include <string>
#include <vector>

namespace clipxfer::test {

class MemoryChannelTest : public ::testing::Test {
protected:
    memory_channel channel_;
};

TEST_F(MemoryChannelTest, StartsEmpty) {
    auto value = channel_.read();

    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value.value().empty());
    EXPECT_EQ(channel_.type(), "memory");
}

TEST_F(MemoryChannelTest, WriteReplacesValue) {
    ASSERT_TRUE(channel_.write("first").has_value());
    ASSERT_TRUE(channel_.write("second").has_value());

    EXPECT_EQ(channel_.read().value(), "second");
    EXPECT_EQ(channel_.write_count(), 2u);
}

TEST_F(MemoryChannelTest, InitialValue) {
    memory_channel channel("stale");

    EXPECT_EQ(channel.peek(), "stale");
}

TEST_F(MemoryChannelTest, InjectedReadFailures) {
    channel_.fail_next_reads(2);

    auto first = channel_.read();
    auto second = channel_.read();
    auto third = channel_.read();

    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, error_code::channel_read_error);
    EXPECT_FALSE(second.has_value());
    EXPECT_TRUE(third.has_value());
}

TEST_F(MemoryChannelTest, InjectedWriteFailuresKeepValue) {
    ASSERT_TRUE(channel_.write("kept").has_value());
    channel_.fail_next_writes(1);

    auto failed = channel_.write("lost");

    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::channel_write_error);
    EXPECT_EQ(channel_.peek(), "kept");
    EXPECT_EQ(channel_.write_count(), 1u);
}

TEST_F(MemoryChannelTest, OverwriteBypassesObserver) {
    std::vector<std::string> observed;
    channel_.set_write_observer([&](const std::string& text) { observed.push_back(text); });

    ASSERT_TRUE(channel_.write("a").has_value());
    channel_.overwrite("noise");

    EXPECT_EQ(observed, (std::vector<std::string>{"a"}));
    EXPECT_EQ(channel_.peek(), "noise");
}

TEST_F(MemoryChannelTest, ObserverMayWriteBack) {
    channel_.set_write_observer([this](const std::string& text) {
        if (text == "ping") {
            (void)channel_.write("pong");
        }
    });

    ASSERT_TRUE(channel_.write("ping").has_value());

    EXPECT_EQ(channel_.peek(), "pong");
}

}  // namespace clipxfer::test
