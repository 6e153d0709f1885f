/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <clipxfer/clipxfer.h>

namespace clipxfer::test {

class VersionTest : public ::testing::Test {};

TEST_F(VersionTest, ComponentsAreCorrect) {
    EXPECT_EQ(version::major, 0);
    EXPECT_EQ(version::minor, 1);
    EXPECT_EQ(version::patch, 0);
}

TEST_F(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

TEST_F(VersionTest, WireVersionIsOne) {
    EXPECT_EQ(wire_version, 1u);
}

}  // namespace clipxfer::test
