/**
 * @file test_checksum.cpp
 * @brief Unit tests for SHA-256 helpers
 */

#include <gtest/gtest.h>

#include <clipxfer/core/checksum.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace clipxfer::test {

namespace {

auto as_bytes(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> out(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        out[i] = static_cast<std::byte>(text[i]);
    }
    return out;
}

constexpr const char* empty_sha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* abc_sha256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

}  // namespace

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "clipxfer_test_checksum";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto write_file(const std::string& name, const std::string& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    std::filesystem::path test_dir_;
};

TEST_F(ChecksumTest, Sha256_KnownVectors) {
    EXPECT_EQ(checksum::sha256(as_bytes("")), empty_sha256);
    EXPECT_EQ(checksum::sha256(as_bytes("abc")), abc_sha256);
}

TEST_F(ChecksumTest, Sha256File_MatchesInMemoryDigest) {
    std::string content(300000, 'x');
    for (std::size_t i = 0; i < content.size(); i += 7) {
        content[i] = static_cast<char>('a' + (i % 26));
    }
    auto path = write_file("large.bin", content);

    auto result = checksum::sha256_file(path);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), checksum::sha256(as_bytes(content)));
}

TEST_F(ChecksumTest, Sha256File_EmptyFile) {
    auto path = write_file("empty.bin", "");

    auto result = checksum::sha256_file(path);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), empty_sha256);
}

TEST_F(ChecksumTest, Sha256File_MissingFile) {
    auto result = checksum::sha256_file(test_dir_ / "missing.bin");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::file_not_found);
}

TEST_F(ChecksumTest, VerifySha256_IgnoresCase) {
    auto path = write_file("abc.txt", "abc");
    std::string upper = abc_sha256;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    EXPECT_TRUE(checksum::verify_sha256(path, abc_sha256));
    EXPECT_TRUE(checksum::verify_sha256(path, upper));
    EXPECT_FALSE(checksum::verify_sha256(path, empty_sha256));
}

TEST_F(ChecksumTest, IsSha256Hex) {
    EXPECT_TRUE(checksum::is_sha256_hex(abc_sha256));
    EXPECT_FALSE(checksum::is_sha256_hex("abc"));
    EXPECT_FALSE(checksum::is_sha256_hex(std::string(64, 'g')));
    EXPECT_FALSE(checksum::is_sha256_hex(std::string(65, 'a')));
}

}  // namespace clipxfer::test
