/**
 * @file test_file_partitioner.cpp
 * @brief Unit tests for splitting large files into parts and joining them
 */

#include <gtest/gtest.h>

#include <clipxfer/core/checksum.h>
#include <clipxfer/core/file_partitioner.h>

#include <filesystem>
#include <fstream>
#include <random>

namespace clipxfer::test {

class FilePartitionerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "clipxfer_test_partitioner";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        std::mt19937 gen(7);
        std::uniform_int_distribution<> dis(0, 255);
        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }
        return path;
    }

    std::filesystem::path test_dir_;
};

TEST_F(FilePartitionerTest, PartName_ZeroPadded) {
    EXPECT_EQ(file_partitioner::part_name("video.mkv", 1), "video.mkv.001");
    EXPECT_EQ(file_partitioner::part_name("video.mkv", 42), "video.mkv.042");
    EXPECT_EQ(file_partitioner::part_name("video.mkv", 1234), "video.mkv.1234");
}

TEST_F(FilePartitionerTest, Split_SizesAndNames) {
    auto source = create_test_file("big.bin", 2500);

    auto parts = file_partitioner::split(source, 1000, test_dir_ / "parts");

    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts.value().size(), 3u);
    EXPECT_EQ(parts.value()[0].filename(), "big.bin.001");
    EXPECT_EQ(parts.value()[2].filename(), "big.bin.003");
    EXPECT_EQ(std::filesystem::file_size(parts.value()[0]), 1000u);
    EXPECT_EQ(std::filesystem::file_size(parts.value()[1]), 1000u);
    EXPECT_EQ(std::filesystem::file_size(parts.value()[2]), 500u);
}

TEST_F(FilePartitionerTest, Split_ExactMultiple) {
    auto source = create_test_file("exact.bin", 3000);

    auto parts = file_partitioner::split(source, 1000, test_dir_ / "parts");

    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts.value().size(), 3u);
}

TEST_F(FilePartitionerTest, JoinRestoresOriginal) {
    auto source = create_test_file("restore.bin", 12345);
    auto parts = file_partitioner::split(source, 4096, test_dir_ / "parts");
    ASSERT_TRUE(parts.has_value());

    auto joined_path = test_dir_ / "joined.bin";
    auto joined = file_partitioner::join(parts.value(), joined_path);

    ASSERT_TRUE(joined.has_value());
    EXPECT_EQ(joined.value(), 12345u);
    EXPECT_EQ(checksum::sha256_file(joined_path).value(),
              checksum::sha256_file(source).value());
}

TEST_F(FilePartitionerTest, Split_ZeroPartSizeRejected) {
    auto source = create_test_file("small.bin", 10);

    auto parts = file_partitioner::split(source, 0, test_dir_ / "parts");

    ASSERT_FALSE(parts.has_value());
    EXPECT_EQ(parts.error().code, error_code::invalid_configuration);
}

TEST_F(FilePartitionerTest, Split_MissingSource) {
    auto parts = file_partitioner::split(test_dir_ / "nope.bin", 100, test_dir_ / "parts");

    ASSERT_FALSE(parts.has_value());
    EXPECT_EQ(parts.error().code, error_code::file_not_found);
}

TEST_F(FilePartitionerTest, Join_MissingPart) {
    auto source = create_test_file("gap.bin", 300);
    auto parts = file_partitioner::split(source, 100, test_dir_ / "parts");
    ASSERT_TRUE(parts.has_value());
    std::filesystem::remove(parts.value()[1]);

    auto joined = file_partitioner::join(parts.value(), test_dir_ / "out.bin");

    ASSERT_FALSE(joined.has_value());
    EXPECT_EQ(joined.error().code, error_code::file_read_error);
}

}  // namespace clipxfer::test
