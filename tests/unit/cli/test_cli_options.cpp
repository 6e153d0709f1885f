/**
 * @file test_cli_options.cpp
 * @brief Unit tests for command line parsing
 */

#include <gtest/gtest.h>

#include <clipxfer/cli/cli_options.h>

#include <filesystem>
#include <string>
#include <vector>

namespace clipxfer::test {

class CliOptionsTest : public ::testing::Test {
protected:
    static auto parse(std::vector<std::string> args) -> result<cli_options> {
        return parse_cli(args);
    }
};

TEST_F(CliOptionsTest, ParseSize_Suffixes) {
    EXPECT_EQ(parse_size("1234").value(), 1234u);
    EXPECT_EQ(parse_size("768K").value(), 786432u);
    EXPECT_EQ(parse_size("2m").value(), 2u * 1024 * 1024);
    EXPECT_EQ(parse_size("1G").value(), 1024ull * 1024 * 1024);
}

TEST_F(CliOptionsTest, ParseSize_Invalid) {
    EXPECT_FALSE(parse_size("").has_value());
    EXPECT_FALSE(parse_size("K").has_value());
    EXPECT_FALSE(parse_size("-5").has_value());
    EXPECT_FALSE(parse_size("12kb").has_value());
    EXPECT_FALSE(parse_size("99999999999999999999").has_value());
    EXPECT_FALSE(parse_size("17179869184G").has_value());
}

TEST_F(CliOptionsTest, Send_Defaults) {
    auto options = parse({"send", "-f", "report.pdf"});

    ASSERT_TRUE(options.has_value()) << options.error().message;
    EXPECT_EQ(options.value().command, cli_command::send);
    EXPECT_EQ(options.value().file, std::filesystem::path("report.pdf"));
    EXPECT_EQ(options.value().send.chunk_size, chunk_config::default_chunk_size);
    EXPECT_FALSE(options.value().send.archive);
    EXPECT_FALSE(options.value().send.part_size.has_value());
    EXPECT_EQ(options.value().channel.kind, channel_kind::clipboard);
}

TEST_F(CliOptionsTest, Send_AllOptions) {
    auto options = parse({"send", "--file", "big.iso", "-c", "512K", "--dividing", "2M",
                          "--part-size", "100M", "-a", "--timeout-ms", "5000",
                          "--poll-ms", "50", "--channel", "file:/tmp/slot", "-v", "--clear"});

    ASSERT_TRUE(options.has_value()) << options.error().message;
    const auto& o = options.value();
    EXPECT_EQ(o.send.chunk_size, 512u * 1024);
    EXPECT_EQ(o.send.dividing_size, 2u * 1024 * 1024);
    EXPECT_EQ(o.send.part_size, 100u * 1024 * 1024);
    EXPECT_TRUE(o.send.archive);
    EXPECT_EQ(o.send.ack_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(o.send.poll_interval, std::chrono::milliseconds(50));
    EXPECT_EQ(o.channel.kind, channel_kind::file);
    EXPECT_EQ(o.channel.file_path, std::filesystem::path("/tmp/slot"));
    EXPECT_TRUE(o.verbose);
    EXPECT_TRUE(o.clear_channel);
}

TEST_F(CliOptionsTest, Send_RequiresFile) {
    auto options = parse({"send", "-c", "1K"});

    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(options.error().code, error_code::invalid_configuration);
}

TEST_F(CliOptionsTest, Send_InvalidChunking) {
    EXPECT_FALSE(parse({"send", "-f", "x", "-c", "0"}).has_value());
    EXPECT_FALSE(parse({"send", "-f", "x", "-c", "2K", "--dividing", "1K"}).has_value());
    EXPECT_FALSE(parse({"send", "-f", "x", "--poll-ms", "100", "--timeout-ms", "10"}).has_value());
}

TEST_F(CliOptionsTest, Receive_Options) {
    auto options = parse({"receive", "-o", "incoming", "--exit-after-one", "--streaming",
                          "--no-resume", "--work-dir", "/var/tmp/cx"});

    ASSERT_TRUE(options.has_value()) << options.error().message;
    const auto& r = options.value().receive;
    EXPECT_EQ(options.value().command, cli_command::receive);
    EXPECT_EQ(r.output_directory, std::filesystem::path("incoming"));
    EXPECT_TRUE(r.exit_after_one_transfer);
    EXPECT_EQ(r.mode, receive_mode::streaming);
    EXPECT_FALSE(r.resume);
    EXPECT_EQ(r.work_directory, std::filesystem::path("/var/tmp/cx"));
}

TEST_F(CliOptionsTest, Receive_RequiresOutput) {
    EXPECT_FALSE(parse({"receive"}).has_value());
}

TEST_F(CliOptionsTest, OptionsAreCommandSpecific) {
    EXPECT_FALSE(parse({"receive", "-o", "dir", "-f", "file"}).has_value());
    EXPECT_FALSE(parse({"send", "-f", "file", "--streaming"}).has_value());
}

TEST_F(CliOptionsTest, MissingArgument) {
    auto options = parse({"send", "-f"});

    ASSERT_FALSE(options.has_value());
    EXPECT_NE(options.error().message.find("requires an argument"), std::string::npos);
}

TEST_F(CliOptionsTest, HelpAndVersion) {
    EXPECT_EQ(parse({"--help"}).value().command, cli_command::help);
    EXPECT_EQ(parse({"send", "-h"}).value().command, cli_command::help);
    EXPECT_EQ(parse({"--version"}).value().command, cli_command::version);
}

TEST_F(CliOptionsTest, UnknownCommandOrOption) {
    EXPECT_FALSE(parse({}).has_value());
    EXPECT_FALSE(parse({"upload"}).has_value());
    EXPECT_FALSE(parse({"send", "-f", "x", "--bogus"}).has_value());
    EXPECT_FALSE(parse({"send", "-f", "x", "--channel", "carrier-pigeon"}).has_value());
}

TEST_F(CliOptionsTest, UsageMentionsCommands) {
    auto text = usage("clipxfer");

    EXPECT_NE(text.find("clipxfer send -f FILE"), std::string::npos);
    EXPECT_NE(text.find("clipxfer receive -o DIR"), std::string::npos);
}

}  // namespace clipxfer::test
