/**
 * @file test_chunk_splitter.cpp
 * @brief Unit tests for chunk_config and chunk_splitter
 */

#include <gtest/gtest.h>

#include <clipxfer/core/chunk_splitter.h>

#include <filesystem>
#include <fstream>
#include <vector>

namespace clipxfer::test {

class ChunkSplitterTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "clipxfer_test_splitter";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    /// Byte i of the file is (i * 31 + 7) mod 256
    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::vector<char> bytes(size);
        for (std::size_t i = 0; i < size; ++i) {
            bytes[i] = static_cast<char>((i * 31 + 7) & 0xFF);
        }
        std::ofstream(path, std::ios::binary)
            .write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::vector<std::byte> {
        std::ifstream file(path, std::ios::binary);
        std::vector<std::byte> out;
        char c;
        while (file.get(c)) {
            out.push_back(static_cast<std::byte>(c));
        }
        return out;
    }

    std::filesystem::path test_dir_;
};

// chunk_config Tests

TEST_F(ChunkSplitterTest, ChunkConfig_DefaultValues) {
    chunk_config config;

    EXPECT_EQ(config.chunk_size, 768u * 1024u);
    EXPECT_FALSE(config.dividing_size.has_value());
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ChunkSplitterTest, ChunkConfig_ZeroSizeRejected) {
    chunk_config config(0);

    auto result = config.validate();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_chunk_size);
}

TEST_F(ChunkSplitterTest, ChunkConfig_DividingSmallerThanChunkRejected) {
    chunk_config config(1024, 512);

    auto result = config.validate();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
}

TEST_F(ChunkSplitterTest, ChunkConfig_Counts) {
    chunk_config config(786432, 1048576);

    EXPECT_EQ(config.chunk_count(2000000), 3u);
    EXPECT_EQ(config.chunk_count(786432), 1u);
    EXPECT_EQ(config.chunk_count(0), 0u);
    EXPECT_EQ(config.dividing_count(2000000), 2u);
}

// chunk_splitter Tests

TEST_F(ChunkSplitterTest, Split_TwoMillionBytesIntoThreeChunks) {
    auto path = create_test_file("two_million.bin", 2000000);
    chunk_splitter splitter(chunk_config(786432));

    auto iter = splitter.split(path);
    ASSERT_TRUE(iter.has_value());
    EXPECT_EQ(iter.value().total_chunks(), 3u);

    std::vector<std::size_t> sizes;
    std::vector<uint64_t> indices;
    while (iter.value().has_next()) {
        auto c = iter.value().next();
        ASSERT_TRUE(c.has_value());
        sizes.push_back(c.value().data.size());
        indices.push_back(c.value().sequence_index);
        EXPECT_EQ(c.value().sequence_count, 3u);
    }

    EXPECT_EQ(sizes, (std::vector<std::size_t>{786432, 786432, 427136}));
    EXPECT_EQ(indices, (std::vector<uint64_t>{1, 2, 3}));
}

TEST_F(ChunkSplitterTest, Split_ConcatenationEqualsFile) {
    auto path = create_test_file("data.bin", 10000);
    chunk_splitter splitter(chunk_config(3000));

    auto iter = splitter.split(path);
    ASSERT_TRUE(iter.has_value());

    std::vector<std::byte> joined;
    while (iter.value().has_next()) {
        auto c = iter.value().next();
        ASSERT_TRUE(c.has_value());
        EXPECT_EQ(c.value().offset, joined.size());
        joined.insert(joined.end(), c.value().data.begin(), c.value().data.end());
    }

    EXPECT_EQ(joined, read_file(path));
}

TEST_F(ChunkSplitterTest, Split_LastChunkFlag) {
    auto path = create_test_file("flags.bin", 2500);
    chunk_splitter splitter(chunk_config(1000));

    auto iter = splitter.split(path);
    ASSERT_TRUE(iter.has_value());

    auto first = iter.value().next();
    auto second = iter.value().next();
    auto third = iter.value().next();
    ASSERT_TRUE(first && second && third);
    EXPECT_FALSE(first.value().is_last());
    EXPECT_FALSE(second.value().is_last());
    EXPECT_TRUE(third.value().is_last());
    EXPECT_FALSE(iter.value().has_next());
}

TEST_F(ChunkSplitterTest, Split_EmptyFileYieldsOneEmptyChunk) {
    auto path = create_test_file("empty.bin", 0);
    chunk_splitter splitter(chunk_config(1024));

    auto iter = splitter.split(path);
    ASSERT_TRUE(iter.has_value());
    ASSERT_EQ(iter.value().total_chunks(), 1u);

    auto c = iter.value().next();
    ASSERT_TRUE(c.has_value());
    EXPECT_TRUE(c.value().data.empty());
    EXPECT_EQ(c.value().sequence_index, 1u);
    EXPECT_EQ(c.value().sequence_count, 1u);
}

TEST_F(ChunkSplitterTest, Split_DividingPositions) {
    auto path = create_test_file("divided.bin", 4000);
    chunk_splitter splitter(chunk_config(1000, 2000));

    auto iter = splitter.split(path);
    ASSERT_TRUE(iter.has_value());

    std::vector<uint64_t> dividing;
    while (iter.value().has_next()) {
        auto c = iter.value().next();
        ASSERT_TRUE(c.has_value());
        ASSERT_TRUE(c.value().dividing_index.has_value());
        EXPECT_EQ(c.value().dividing_count, 2u);
        dividing.push_back(*c.value().dividing_index);
    }

    EXPECT_EQ(dividing, (std::vector<uint64_t>{1, 1, 2, 2}));
}

TEST_F(ChunkSplitterTest, Split_NoDividingWithoutConfig) {
    auto path = create_test_file("plain.bin", 100);
    chunk_splitter splitter(chunk_config(64));

    auto iter = splitter.split(path);
    ASSERT_TRUE(iter.has_value());
    auto c = iter.value().next();
    ASSERT_TRUE(c.has_value());

    EXPECT_FALSE(c.value().dividing_index.has_value());
    EXPECT_FALSE(c.value().dividing_count.has_value());
}

TEST_F(ChunkSplitterTest, Split_MissingFile) {
    chunk_splitter splitter;

    auto iter = splitter.split(test_dir_ / "missing.bin");

    ASSERT_FALSE(iter.has_value());
    EXPECT_EQ(iter.error().code, error_code::file_not_found);
}

TEST_F(ChunkSplitterTest, Next_PastEndFails) {
    auto path = create_test_file("one.bin", 10);
    chunk_splitter splitter(chunk_config(64));

    auto iter = splitter.split(path);
    ASSERT_TRUE(iter.has_value());
    ASSERT_TRUE(iter.value().next().has_value());

    auto extra = iter.value().next();
    ASSERT_FALSE(extra.has_value());
    EXPECT_EQ(extra.error().code, error_code::invalid_chunk_index);
}

}  // namespace clipxfer::test
