/**
 * @file test_scoped_directory.cpp
 * @brief Unit tests for scoped_directory and random_hex
 */

#include <gtest/gtest.h>

#include <clipxfer/core/scoped_directory.h>

#include <cctype>
#include <filesystem>
#include <fstream>

namespace clipxfer::test {

class ScopedDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        parent_ = std::filesystem::temp_directory_path() / "clipxfer_test_scoped";
        std::filesystem::create_directories(parent_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(parent_, ec);
    }

    std::filesystem::path parent_;
};

TEST_F(ScopedDirectoryTest, RemovedOnDestruction) {
    std::filesystem::path created;
    {
        auto dir = scoped_directory::create(parent_, "work_");
        ASSERT_TRUE(dir.has_value());
        created = dir.value().path();
        EXPECT_TRUE(std::filesystem::is_directory(created));
        EXPECT_EQ(created.filename().string().rfind("work_", 0), 0u);

        std::ofstream(created / "file.txt") << "content";
    }

    EXPECT_FALSE(std::filesystem::exists(created));
}

TEST_F(ScopedDirectoryTest, MoveTransfersOwnership) {
    auto dir = scoped_directory::create(parent_, "move_");
    ASSERT_TRUE(dir.has_value());
    auto path = dir.value().path();

    {
        scoped_directory moved(std::move(dir.value()));
        EXPECT_EQ(moved.path(), path);
        EXPECT_TRUE(dir.value().path().empty());
    }

    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ScopedDirectoryTest, UniqueNames) {
    auto a = scoped_directory::create(parent_, "same_");
    auto b = scoped_directory::create(parent_, "same_");
    ASSERT_TRUE(a && b);

    EXPECT_NE(a.value().path(), b.value().path());
}

TEST_F(ScopedDirectoryTest, RandomHex) {
    auto value = random_hex(16);

    EXPECT_EQ(value.size(), 16u);
    for (char c : value) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)));
    }
    EXPECT_NE(random_hex(16), random_hex(16));
}

}  // namespace clipxfer::test
