/**
 * @file test_basic_scenarios.cpp
 * @brief End-to-end transfers between a sender and a receiver sharing a channel
 */

#include "test_fixtures.h"

#include <clipxfer/archive/command_archiver.h>
#include <clipxfer/channel/file_channel.h>
#include <clipxfer/core/process.h>

namespace clipxfer::test {

class BasicTransferTest : public TransferFixture {};

TEST_F(BasicTransferTest, SmallFileRoundTrip) {
    auto source = create_test_file("small.bin", test_data::small_file_size);
    start_receiver();

    auto summary = send_file(source);

    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary.value().packets, 1u);

    auto outcomes = wait_for_outcomes(1);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].verified);
    EXPECT_EQ(outcomes[0].actual_hash, summary.value().content_hash);
    EXPECT_TRUE(files_equal(source, download_dir_ / "small.bin"));
}

TEST_F(BasicTransferTest, DefaultChunkSizeSplitsIntoThreePackets) {
    auto source = create_test_file("two_million.bin", test_data::medium_file_size);
    start_receiver();

    auto summary = send_file(source);

    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary.value().packets, 3u);
    EXPECT_EQ(summary.value().bytes, test_data::medium_file_size);
    ASSERT_EQ(wait_for_outcomes(1).size(), 1u);
    EXPECT_TRUE(files_equal(source, download_dir_ / "two_million.bin"));
}

TEST_F(BasicTransferTest, EmptyFile) {
    auto source = create_test_file("empty.txt", 0);
    start_receiver();

    auto summary = send_file(source);

    ASSERT_TRUE(summary.has_value());
    auto outcomes = wait_for_outcomes(1);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].verified);
    EXPECT_TRUE(std::filesystem::exists(download_dir_ / "empty.txt"));
    EXPECT_EQ(std::filesystem::file_size(download_dir_ / "empty.txt"), 0u);
}

TEST_F(BasicTransferTest, SmallChunksWithDividing) {
    auto source = create_text_file("text.txt", 200 * 1024);
    start_receiver();

    auto builder = sender_builder();
    builder.with_chunk_size(test_data::small_chunk_size)
           .with_dividing_size(4 * test_data::small_chunk_size);
    auto summary = send_file(source, std::move(builder));

    ASSERT_TRUE(summary.has_value());
    EXPECT_GT(summary.value().packets, 10u);
    ASSERT_EQ(wait_for_outcomes(1).size(), 1u);
    EXPECT_TRUE(files_equal(source, download_dir_ / "text.txt"));
}

TEST_F(BasicTransferTest, MultipartTransfer) {
    auto source = create_test_file("volume.bin", 250 * 1024);
    start_receiver();

    auto builder = sender_builder();
    builder.with_chunk_size(test_data::small_chunk_size).with_part_size(100 * 1024);
    auto summary = send_file(source, std::move(builder));

    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary.value().parts, 3u);
    auto outcomes = wait_for_outcomes(1);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].verified);
    EXPECT_TRUE(files_equal(source, download_dir_ / "volume.bin"));
}

TEST_F(BasicTransferTest, StreamingMode) {
    auto source = create_test_file("stream.bin", 100 * 1024);
    start_receiver(receive_mode::streaming);

    auto builder = sender_builder();
    builder.with_chunk_size(test_data::small_chunk_size);
    auto summary = send_file(source, std::move(builder));

    ASSERT_TRUE(summary.has_value());
    ASSERT_EQ(wait_for_outcomes(1).size(), 1u);
    EXPECT_TRUE(files_equal(source, download_dir_ / "stream.bin"));
}

TEST_F(BasicTransferTest, ConsecutiveTransfers) {
    auto first = create_test_file("first.bin", 40 * 1024);
    auto second = create_text_file("second.txt", 40 * 1024);
    start_receiver();

    auto builder = sender_builder();
    builder.with_chunk_size(test_data::small_chunk_size);
    ASSERT_TRUE(send_file(first, std::move(builder)).has_value());
    ASSERT_EQ(wait_for_outcomes(1).size(), 1u);

    auto again = sender_builder();
    again.with_chunk_size(test_data::small_chunk_size);
    ASSERT_TRUE(send_file(second, std::move(again)).has_value());
    ASSERT_EQ(wait_for_outcomes(2).size(), 2u);

    EXPECT_TRUE(files_equal(first, download_dir_ / "first.bin"));
    EXPECT_TRUE(files_equal(second, download_dir_ / "second.txt"));
}

TEST_F(BasicTransferTest, ExistingOutputIsReplaced) {
    auto source = create_test_file("report.bin", 4096);
    {
        std::ofstream stale(download_dir_ / "report.bin");
        stale << "stale contents";
    }
    start_receiver();

    ASSERT_TRUE(send_file(source).has_value());

    ASSERT_EQ(wait_for_outcomes(1).size(), 1u);
    EXPECT_TRUE(files_equal(source, download_dir_ / "report.bin"));
}

TEST_F(BasicTransferTest, ArchivedTransfer) {
    if (!find_executable("tar") || !find_executable("xz")) {
        GTEST_SKIP() << "tar or xz not installed";
    }
    auto source = create_text_file("notes.txt", 64 * 1024);
    start_receiver();

    auto builder = sender_builder();
    builder.with_archive(std::make_unique<command_archiver>(archive_tool::tar_xz));
    auto summary = send_file(source, std::move(builder));

    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary.value().filename, "notes.txt.tar.xz");
    EXPECT_LT(summary.value().bytes, 64u * 1024);

    auto outcomes = wait_for_outcomes(1);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].verified);
    EXPECT_EQ(outcomes[0].archive_type, ".tar.xz");
    EXPECT_TRUE(std::filesystem::exists(download_dir_ / "notes.txt.tar.xz"));
}

class FileChannelTransferTest : public TransferFixture {
protected:
    void SetUp() override {
        TransferFixture::SetUp();
        receiver_side_ = std::make_unique<file_channel>(test_dir_ / "slot.txt");
        sender_side_ = std::make_unique<file_channel>(test_dir_ / "slot.txt");
    }

    void TearDown() override {
        stop_receiver();
        receiver_side_.reset();
        sender_side_.reset();
        TransferFixture::TearDown();
    }

    std::unique_ptr<file_channel> receiver_side_;
    std::unique_ptr<file_channel> sender_side_;
};

TEST_F(FileChannelTransferTest, RoundTripThroughSharedFile) {
    auto source = create_test_file("shared.bin", 50 * 1024);
    start_receiver(receive_mode::chunk_store, receiver_side_.get());

    auto builder = sender_builder();
    builder.with_chunk_size(test_data::small_chunk_size);
    auto summary = send_file(source, std::move(builder), sender_side_.get());

    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    ASSERT_EQ(wait_for_outcomes(1).size(), 1u);
    EXPECT_TRUE(files_equal(source, download_dir_ / "shared.bin"));
}

TEST_F(BasicTransferTest, ReceiverRunStopsAfterOneTransfer) {
    auto source = create_test_file("once.bin", 2048);
    auto engine = receiver_engine::builder()
        .with_output_directory(download_dir_)
        .with_work_directory(test_dir_ / "receiver_work")
        .with_poll_interval(std::chrono::milliseconds(1))
        .with_exit_after_one_transfer(true)
        .build(channel_);
    ASSERT_TRUE(engine.has_value());

    std::optional<result<receive_summary>> run_summary;
    std::thread receiver([&]() {
        cancellation_token token;
        run_summary.emplace(engine.value().run(token.with_timeout(std::chrono::seconds(30))));
    });
    auto sent = send_file(source);
    receiver.join();

    ASSERT_TRUE(sent.has_value());
    ASSERT_TRUE(run_summary.has_value());
    ASSERT_TRUE(run_summary->has_value());
    EXPECT_FALSE(run_summary->value().cancelled);
    EXPECT_EQ(run_summary->value().transfers_completed, 1u);
}

}  // namespace clipxfer::test
