/**
 * @file cli_options.cpp
 * @brief Command line parsing for the clipxfer tool
 */

#include <clipxfer/cli/cli_options.h>

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace clipxfer {

namespace {

auto usage_error(const std::string& message) -> unexpected {
    return unexpected(error{error_code::invalid_configuration, message});
}

auto parse_count(const std::string& option, const std::string& text) -> result<uint64_t> {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        return usage_error(option + " expects a non-negative number, got '" + text + "'");
    }
    try {
        std::size_t pos = 0;
        auto value = std::stoull(text, &pos);
        if (pos != text.size()) {
            return usage_error(option + " expects a number, got '" + text + "'");
        }
        return static_cast<uint64_t>(value);
    } catch (const std::exception&) {
        return usage_error(option + " value out of range: '" + text + "'");
    }
}

}  // namespace

auto parse_size(std::string_view text) -> result<uint64_t> {
    std::string value(text);
    if (value.empty()) {
        return usage_error("empty size");
    }

    uint64_t multiplier = 1;
    switch (std::toupper(static_cast<unsigned char>(value.back()))) {
        case 'K': multiplier = 1024; break;
        case 'M': multiplier = 1024 * 1024; break;
        case 'G': multiplier = 1024 * 1024 * 1024; break;
        default: break;
    }
    if (multiplier != 1) {
        value.pop_back();
    }

    auto number = parse_count("size", value);
    if (!number) {
        return usage_error("invalid size '" + std::string(text) + "'");
    }
    if (number.value() > UINT64_MAX / multiplier) {
        return usage_error("size too large: '" + std::string(text) + "'");
    }
    return number.value() * multiplier;
}

auto parse_cli(const std::vector<std::string>& args) -> result<cli_options> {
    cli_options options;
    if (args.empty()) {
        return usage_error("missing command (send or receive)");
    }

    const auto& command = args.front();
    if (command == "-h" || command == "--help" || command == "help") {
        options.command = cli_command::help;
        return options;
    }
    if (command == "--version" || command == "version") {
        options.command = cli_command::version;
        return options;
    }
    if (command == "send") {
        options.command = cli_command::send;
    } else if (command == "receive") {
        options.command = cli_command::receive;
    } else {
        return usage_error("unknown command '" + command + "'");
    }
    const bool sending = options.command == cli_command::send;

    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];

        auto next_value = [&]() -> result<std::string> {
            if (i + 1 >= args.size()) {
                return usage_error(arg + " requires an argument");
            }
            return args[++i];
        };
        auto next_size = [&]() -> result<uint64_t> {
            auto text = next_value();
            if (!text) {
                return unexpected(text.error());
            }
            return parse_size(text.value());
        };
        auto next_millis = [&]() -> result<std::chrono::milliseconds> {
            auto text = next_value();
            if (!text) {
                return unexpected(text.error());
            }
            auto ms = parse_count(arg, text.value());
            if (!ms) {
                return unexpected(ms.error());
            }
            return std::chrono::milliseconds(static_cast<int64_t>(ms.value()));
        };

        if (arg == "-h" || arg == "--help") {
            options.command = cli_command::help;
            return options;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--clear") {
            options.clear_channel = true;
        } else if (arg == "--channel") {
            auto channel_name = next_value();
            if (!channel_name) {
                return unexpected(channel_name.error());
            }
            auto channel = channel_config::parse(channel_name.value());
            if (!channel) {
                return unexpected(channel.error());
            }
            options.channel = channel.value();
        } else if (arg == "--poll-ms") {
            auto ms = next_millis();
            if (!ms) {
                return unexpected(ms.error());
            }
            options.send.poll_interval = ms.value();
            options.receive.poll_interval = ms.value();
        } else if (arg == "--work-dir") {
            auto dir = next_value();
            if (!dir) {
                return unexpected(dir.error());
            }
            options.send.work_directory = dir.value();
            options.receive.work_directory = dir.value();
        } else if (sending && (arg == "-f" || arg == "--file")) {
            auto file = next_value();
            if (!file) {
                return unexpected(file.error());
            }
            options.file = file.value();
        } else if (sending && (arg == "-c" || arg == "--chunk-size")) {
            auto size = next_size();
            if (!size) {
                return unexpected(size.error());
            }
            options.send.chunk_size = static_cast<std::size_t>(size.value());
        } else if (sending && arg == "--dividing") {
            auto size = next_size();
            if (!size) {
                return unexpected(size.error());
            }
            options.send.dividing_size = static_cast<std::size_t>(size.value());
        } else if (sending && arg == "--part-size") {
            auto size = next_size();
            if (!size) {
                return unexpected(size.error());
            }
            options.send.part_size = size.value();
        } else if (sending && (arg == "-a" || arg == "--archive")) {
            options.send.archive = true;
        } else if (sending && arg == "--timeout-ms") {
            auto ms = next_millis();
            if (!ms) {
                return unexpected(ms.error());
            }
            options.send.ack_timeout = ms.value();
        } else if (!sending && (arg == "-o" || arg == "--output")) {
            auto dir = next_value();
            if (!dir) {
                return unexpected(dir.error());
            }
            options.receive.output_directory = dir.value();
        } else if (!sending && arg == "--exit-after-one") {
            options.receive.exit_after_one_transfer = true;
        } else if (!sending && arg == "--streaming") {
            options.receive.mode = receive_mode::streaming;
        } else if (!sending && arg == "--no-resume") {
            options.receive.resume = false;
        } else {
            return usage_error("unknown option '" + arg + "' for " + command);
        }
    }

    if (sending) {
        if (options.file.empty()) {
            return usage_error("send requires -f FILE");
        }
        if (auto valid = options.send.validate(); !valid) {
            return unexpected(valid.error());
        }
    } else {
        if (options.receive.output_directory.empty()) {
            return usage_error("receive requires -o DIR");
        }
        if (auto valid = options.receive.validate(); !valid) {
            return unexpected(valid.error());
        }
    }
    return options;
}

auto usage(std::string_view program) -> std::string {
    std::ostringstream oss;
    oss << "clipxfer - file transfer over a shared clipboard\n"
        << "\n"
        << "Usage:\n"
        << "  " << program << " send -f FILE [options]\n"
        << "  " << program << " receive -o DIR [options]\n"
        << "\n"
        << "Send options:\n"
        << "  -f, --file <path>       File to send\n"
        << "  -c, --chunk-size <n>    Bytes per packet (default: 768K)\n"
        << "  --dividing <n>          Group chunks by n bytes in progress output\n"
        << "  --part-size <n>         Pre-split files larger than n bytes into parts\n"
        << "  -a, --archive           Compress with 7z, tar or zip before sending\n"
        << "  --timeout-ms <n>        Wait for an ACK before republishing (default: 60000)\n"
        << "\n"
        << "Receive options:\n"
        << "  -o, --output <dir>      Directory receiving the file\n"
        << "  --exit-after-one        Stop after the first verified transfer\n"
        << "  --streaming             Append chunks in order instead of storing each one\n"
        << "  --no-resume             Ignore chunks stored by an earlier run\n"
        << "\n"
        << "Common options:\n"
        << "  --channel <name>        clipboard (default) or file:<path>\n"
        << "  --poll-ms <n>           Channel poll interval (default: 200)\n"
        << "  --work-dir <dir>        Directory for temporary files\n"
        << "  --clear                 Empty the channel before starting\n"
        << "  -v, --verbose           Debug logging\n"
        << "  -h, --help              Show this help message\n"
        << "  --version               Show version\n"
        << "\n"
        << "Sizes accept K, M and G suffixes (e.g. 512K, 2M).\n";
    return oss.str();
}

}  // namespace clipxfer
