/**
 * @file test_receiver_session.cpp
 * @brief Unit tests for per-transfer reception state
 */

#include <gtest/gtest.h>

#include <clipxfer/receiver/receiver_session.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace clipxfer::test {

class ReceiverSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "clipxfer_test_session";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        options_.work_root = test_dir_ / "work";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    static auto make_packet(std::optional<uint32_t> part, std::optional<uint32_t> part_count,
                            uint64_t seq, uint64_t seq_count, const std::string& data)
        -> packet {
        packet p;
        p.base_filename = "movie.mkv";
        p.content_hash = std::string(64, 'c');
        p.part_index = part;
        p.part_count = part_count;
        p.sequence_index = seq;
        p.sequence_count = seq_count;
        for (char c : data) {
            p.payload.push_back(static_cast<std::byte>(c));
        }
        return p;
    }

    static auto read_text(const std::filesystem::path& path) -> std::string {
        std::ifstream file(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }

    std::filesystem::path test_dir_;
    session_options options_;
};

TEST_F(ReceiverSessionTest, SinglePartBecomesReady) {
    auto first = make_packet(std::nullopt, std::nullopt, 1, 2, "hello ");
    auto session = receiver_session::open(first, options_);
    ASSERT_TRUE(session.has_value());
    auto& s = *session.value();

    auto a = s.accept(first);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a.value().status, store_status::stored);
    EXPECT_FALSE(a.value().transfer_ready);

    auto b = s.accept(make_packet(std::nullopt, std::nullopt, 2, 2, "world"));
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE(b.value().part_completed);
    EXPECT_TRUE(b.value().transfer_ready);
    EXPECT_EQ(s.state(), session_state::reassembling_final);

    auto out = test_dir_ / "movie.mkv";
    auto size = s.reassemble(out);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(read_text(out), "hello world");
}

TEST_F(ReceiverSessionTest, MultipartNotReadyUntilEveryPartCompletes) {
    auto p1 = make_packet(1, 2, 1, 1, "AAA");
    auto session = receiver_session::open(p1, options_);
    ASSERT_TRUE(session.has_value());
    auto& s = *session.value();

    // Last chunk of the last part arrives before part 1 finished
    auto last = s.accept(make_packet(2, 2, 2, 2, "DD"));
    ASSERT_TRUE(last.has_value());
    EXPECT_FALSE(last.value().transfer_ready);

    auto part2_first = s.accept(make_packet(2, 2, 1, 2, "CC"));
    ASSERT_TRUE(part2_first.has_value());
    EXPECT_TRUE(part2_first.value().part_completed);
    EXPECT_FALSE(part2_first.value().transfer_ready);
    EXPECT_TRUE(s.is_part_complete(2));
    EXPECT_FALSE(s.is_part_complete(1));

    auto done = s.accept(p1);
    ASSERT_TRUE(done.has_value());
    EXPECT_TRUE(done.value().transfer_ready);
    EXPECT_EQ(s.completed_parts(), 2u);

    auto out = test_dir_ / "joined.bin";
    ASSERT_TRUE(s.reassemble(out).has_value());
    EXPECT_EQ(read_text(out), "AAACCDD");
}

TEST_F(ReceiverSessionTest, TwoPartsOfThreeChunksSecondPartFirst) {
    const std::vector<std::string> part1{"a1", "a2", "a3"};
    const std::vector<std::string> part2{"b1", "b2", "b3"};
    auto opening = make_packet(2, 2, 1, 3, part2[0]);
    auto session = receiver_session::open(opening, options_);
    ASSERT_TRUE(session.has_value());
    auto& s = *session.value();

    for (uint64_t seq = 1; seq <= 3; ++seq) {
        auto r = s.accept(make_packet(2, 2, seq, 3, part2[seq - 1]));
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r.value().status, store_status::stored);
        EXPECT_EQ(r.value().part_completed, seq == 3);
        EXPECT_FALSE(r.value().transfer_ready);
    }
    EXPECT_TRUE(s.is_part_complete(2));
    EXPECT_FALSE(s.is_part_complete(1));
    EXPECT_EQ(s.completed_parts(), 1u);

    for (uint64_t seq = 1; seq <= 3; ++seq) {
        auto r = s.accept(make_packet(1, 2, seq, 3, part1[seq - 1]));
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(r.value().part_completed, seq == 3);
        EXPECT_EQ(r.value().transfer_ready, seq == 3);
    }
    EXPECT_EQ(s.completed_parts(), 2u);

    auto out = test_dir_ / "joined.bin";
    auto size = s.reassemble(out);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(size.value(), 12u);
    EXPECT_EQ(read_text(out), "a1a2a3b1b2b3");
}

TEST_F(ReceiverSessionTest, ReassembleBeforeReadyFails) {
    auto first = make_packet(std::nullopt, std::nullopt, 1, 2, "x");
    auto session = receiver_session::open(first, options_);
    ASSERT_TRUE(session.has_value());
    ASSERT_TRUE(session.value()->accept(first).has_value());

    auto size = session.value()->reassemble(test_dir_ / "early.bin");

    ASSERT_FALSE(size.has_value());
    EXPECT_EQ(size.error().code, error_code::missing_chunks);
}

TEST_F(ReceiverSessionTest, DuplicateAfterPartComplete) {
    auto only = make_packet(1, 2, 1, 1, "x");
    auto session = receiver_session::open(only, options_);
    ASSERT_TRUE(session.has_value());
    ASSERT_TRUE(session.value()->accept(only).value().part_completed);

    auto again = session.value()->accept(only);

    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again.value().status, store_status::duplicate);
    EXPECT_FALSE(again.value().part_completed);
}

TEST_F(ReceiverSessionTest, ChangedSequenceCountIsMismatch) {
    auto first = make_packet(std::nullopt, std::nullopt, 1, 3, "x");
    auto session = receiver_session::open(first, options_);
    ASSERT_TRUE(session.has_value());
    ASSERT_TRUE(session.value()->accept(first).has_value());

    auto other = session.value()->accept(make_packet(std::nullopt, std::nullopt, 2, 4, "y"));

    ASSERT_FALSE(other.has_value());
    EXPECT_EQ(other.error().code, error_code::session_mismatch);
}

TEST_F(ReceiverSessionTest, OtherTransferIsMismatch) {
    auto first = make_packet(std::nullopt, std::nullopt, 1, 1, "x");
    auto session = receiver_session::open(first, options_);
    ASSERT_TRUE(session.has_value());

    auto foreign = first;
    foreign.content_hash = std::string(64, 'd');

    EXPECT_FALSE(session.value()->matches(foreign));
    EXPECT_FALSE(session.value()->accept(foreign).has_value());
}

TEST_F(ReceiverSessionTest, ResumeKeepsStoredChunks) {
    auto first = make_packet(std::nullopt, std::nullopt, 1, 3, "aa");
    {
        auto session = receiver_session::open(first, options_);
        ASSERT_TRUE(session.has_value());
        ASSERT_TRUE(session.value()->accept(first).has_value());
        ASSERT_TRUE(session.value()->accept(
            make_packet(std::nullopt, std::nullopt, 2, 3, "bb")).has_value());
    }

    auto session = receiver_session::open(first, options_);
    ASSERT_TRUE(session.has_value());
    auto& s = *session.value();
    EXPECT_TRUE(s.resumed());

    auto repeat = s.accept(make_packet(std::nullopt, std::nullopt, 2, 3, "bb"));
    ASSERT_TRUE(repeat.has_value());
    EXPECT_EQ(repeat.value().status, store_status::duplicate);
    EXPECT_EQ(s.received_in_part(1), 2u);

    auto last = s.accept(make_packet(std::nullopt, std::nullopt, 3, 3, "cc"));
    ASSERT_TRUE(last.has_value());
    EXPECT_TRUE(last.value().transfer_ready);
}

TEST_F(ReceiverSessionTest, ResumeKeepsCompletedParts) {
    auto p1 = make_packet(1, 2, 1, 1, "first");
    {
        auto session = receiver_session::open(p1, options_);
        ASSERT_TRUE(session.has_value());
        ASSERT_TRUE(session.value()->accept(p1).value().part_completed);
    }

    auto session = receiver_session::open(p1, options_);

    ASSERT_TRUE(session.has_value());
    EXPECT_TRUE(session.value()->is_part_complete(1));
    EXPECT_EQ(session.value()->completed_parts(), 1u);
}

TEST_F(ReceiverSessionTest, NoResumeStartsFresh) {
    auto first = make_packet(std::nullopt, std::nullopt, 1, 2, "aa");
    {
        auto session = receiver_session::open(first, options_);
        ASSERT_TRUE(session.has_value());
        ASSERT_TRUE(session.value()->accept(first).has_value());
    }
    options_.resume = false;

    auto session = receiver_session::open(first, options_);

    ASSERT_TRUE(session.has_value());
    EXPECT_FALSE(session.value()->resumed());
    EXPECT_EQ(session.value()->accept(first).value().status, store_status::stored);
}

TEST_F(ReceiverSessionTest, UnreadableManifestStartsFresh) {
    auto first = make_packet(std::nullopt, std::nullopt, 1, 2, "aa");
    {
        auto session = receiver_session::open(first, options_);
        ASSERT_TRUE(session.has_value());
        ASSERT_TRUE(session.value()->accept(first).has_value());
    }
    std::ofstream(options_.work_root / first.content_hash / "session.json", std::ios::trunc)
        << "{\"file\":\"movie.mkv\",\"sequence_counts\":\"2,x\"";

    auto session = receiver_session::open(first, options_);

    ASSERT_TRUE(session.has_value());
    EXPECT_FALSE(session.value()->resumed());
    EXPECT_EQ(session.value()->accept(first).value().status, store_status::stored);
}

TEST_F(ReceiverSessionTest, StreamingModeDiscardsGaps) {
    options_.mode = receive_mode::streaming;
    auto first = make_packet(std::nullopt, std::nullopt, 1, 3, "1");
    auto session = receiver_session::open(first, options_);
    ASSERT_TRUE(session.has_value());
    auto& s = *session.value();

    ASSERT_EQ(s.accept(first).value().status, store_status::stored);
    EXPECT_EQ(s.accept(make_packet(std::nullopt, std::nullopt, 3, 3, "3")).value().status,
              store_status::discarded);
    EXPECT_EQ(s.accept(make_packet(std::nullopt, std::nullopt, 2, 3, "2")).value().status,
              store_status::stored);
    auto last = s.accept(make_packet(std::nullopt, std::nullopt, 3, 3, "3"));
    ASSERT_TRUE(last.has_value());
    EXPECT_TRUE(last.value().transfer_ready);

    auto out = test_dir_ / "streamed.bin";
    ASSERT_TRUE(s.reassemble(out).has_value());
    EXPECT_EQ(read_text(out), "123");
}

TEST_F(ReceiverSessionTest, DiscardRemovesWorkDirectory) {
    auto first = make_packet(std::nullopt, std::nullopt, 1, 2, "x");
    auto session = receiver_session::open(first, options_);
    ASSERT_TRUE(session.has_value());
    ASSERT_TRUE(session.value()->accept(first).has_value());
    auto dir = session.value()->directory();

    session.value()->discard();

    EXPECT_FALSE(std::filesystem::exists(dir));
}

}  // namespace clipxfer::test
