/**
 * @file test_file_channel.cpp
 * @brief Unit tests for the shared-file channel
 */

#include <gtest/gtest.h>

#include <clipxfer/channel/file_channel.h>

#include <filesystem>
#include <fstream>

namespace clipxfer::test {

class FileChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "clipxfer_test_file_channel";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path test_dir_;
};

TEST_F(FileChannelTest, MissingFileReadsEmpty) {
    file_channel channel(test_dir_ / "slot.txt");

    auto value = channel.read();

    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value.value().empty());
}

TEST_F(FileChannelTest, WriteThenRead) {
    file_channel channel(test_dir_ / "slot.txt");

    ASSERT_TRUE(channel.write("{\"type\":\"ack\"}").has_value());

    EXPECT_EQ(channel.read().value(), "{\"type\":\"ack\"}");
}

TEST_F(FileChannelTest, TwoInstancesShareTheSlot) {
    file_channel sender(test_dir_ / "slot.txt");
    file_channel receiver(test_dir_ / "slot.txt");

    ASSERT_TRUE(sender.write("packet").has_value());
    EXPECT_EQ(receiver.read().value(), "packet");

    ASSERT_TRUE(receiver.write("ack").has_value());
    EXPECT_EQ(sender.read().value(), "ack");
}

TEST_F(FileChannelTest, WriteLeavesNoTemporaryFiles) {
    file_channel channel(test_dir_ / "slot.txt");

    ASSERT_TRUE(channel.write("one").has_value());
    ASSERT_TRUE(channel.write("two").has_value());

    std::size_t entries = 0;
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(test_dir_)) {
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(FileChannelTest, WriteIntoMissingDirectoryFails) {
    file_channel channel(test_dir_ / "missing" / "slot.txt");

    auto result = channel.write("x");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::channel_write_error);
}

}  // namespace clipxfer::test
