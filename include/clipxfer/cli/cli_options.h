/**
 * @file cli_options.h
 * @brief Command line of the clipxfer tool
 */

#ifndef CLIPXFER_CLI_CLI_OPTIONS_H
#define CLIPXFER_CLI_CLI_OPTIONS_H

#include <clipxfer/channel/channel_factory.h>
#include <clipxfer/core/types.h>
#include <clipxfer/receiver/receiver_types.h>
#include <clipxfer/sender/sender_types.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace clipxfer {

/**
 * @brief Subcommand selected on the command line
 */
enum class cli_command {
    send,
    receive,
    help,
    version
};

/**
 * @brief Parsed command line
 */
struct cli_options {
    cli_command command = cli_command::help;
    bool verbose = false;
    bool clear_channel = false;  ///< Empty the channel before starting
    channel_config channel;

    std::filesystem::path file;  ///< send: artifact
    sender_config send;

    receiver_config receive;
};

/**
 * @brief Parse a byte size with an optional K, M or G suffix (binary units)
 */
[[nodiscard]] auto parse_size(std::string_view text) -> result<uint64_t>;

/**
 * @brief Parse the arguments following the program name
 * @return Options, or invalid_configuration with a message for the user
 */
[[nodiscard]] auto parse_cli(const std::vector<std::string>& args) -> result<cli_options>;

/**
 * @brief Usage text
 */
[[nodiscard]] auto usage(std::string_view program) -> std::string;

}  // namespace clipxfer

#endif  // CLIPXFER_CLI_CLI_OPTIONS_H
