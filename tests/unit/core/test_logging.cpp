/**
 * @file test_logging.cpp
 * @brief Unit tests for the logger and transfer log context
 */

#include <gtest/gtest.h>

#include <clipxfer/core/logging.h>

#include <string>
#include <vector>

namespace clipxfer::test {

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, EmptyContext) {
    transfer_log_context ctx;

    EXPECT_EQ(ctx.to_string(), "{}");
}

TEST_F(TransferLogContextTest, RendersSetFieldsOnly) {
    transfer_log_context ctx;
    ctx.filename = "backup.tar";
    ctx.sequence_index = 2;
    ctx.sequence_count = 3;

    EXPECT_EQ(ctx.to_string(), "{file=backup.tar seq=2/3}");
}

TEST_F(TransferLogContextTest, ShortensContentHash) {
    transfer_log_context ctx;
    ctx.content_hash = std::string(64, 'a');
    ctx.part_index = 1;
    ctx.part_count = 4;
    ctx.retries = 7;

    auto text = ctx.to_string();

    EXPECT_NE(text.find("sha256=aaaaaaaaaaaa "), std::string::npos);
    EXPECT_NE(text.find("part=1/4"), std::string::npos);
    EXPECT_NE(text.find("retries=7"), std::string::npos);
    EXPECT_EQ(text.find(std::string(13, 'a')), std::string::npos);
}

// =============================================================================
// Logger Tests
// =============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = get_logger();
        saved_level_ = logger.get_level();
        logger.set_quiet(true);
        logger.set_callback([this](log_level level, std::string_view category,
                                   std::string_view message) {
            records_.push_back({level, std::string(category), std::string(message)});
        });
    }

    void TearDown() override {
        auto& logger = get_logger();
        logger.set_callback(nullptr);
        logger.set_quiet(false);
        logger.set_level(saved_level_);
    }

    struct record {
        log_level level;
        std::string category;
        std::string message;
    };

    std::vector<record> records_;
    log_level saved_level_ = log_level::info;
};

TEST_F(LoggerTest, LevelStrings) {
    EXPECT_EQ(log_level_to_string(log_level::debug), "DEBUG");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    get_logger().set_level(log_level::warn);

    CX_LOG_INFO(log_category::sender, "hidden");
    CX_LOG_WARN(log_category::sender, "shown");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, log_level::warn);
    EXPECT_EQ(records_[0].message, "shown");
    EXPECT_EQ(records_[0].category, "clipxfer.sender");
}

TEST_F(LoggerTest, AppendsContext) {
    get_logger().set_level(log_level::debug);
    transfer_log_context ctx;
    ctx.filename = "a.bin";

    CX_LOG_DEBUG_CTX(log_category::receiver, "stored", ctx);

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "stored {file=a.bin}");
}

}  // namespace clipxfer::test
