/**
 * @file main.cpp
 * @brief clipxfer command line tool
 *
 * Sends a file over the clipboard, or receives one:
 *
 *   clipxfer send -f backup.tar -c 512K
 *   clipxfer receive -o ~/incoming --exit-after-one
 */

#include <clipxfer/cli/cli_options.h>
#include <clipxfer/clipxfer.h>
#include <clipxfer/core/logging.h>

#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

using namespace clipxfer;

namespace {

std::atomic<bool>* g_cancel_flag = nullptr;

void signal_handler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_cancel_flag != nullptr) {
        g_cancel_flag->store(true);
    }
}

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    static constexpr const char* units[] = {"bytes", "KB", "MB", "GB", "TB"};
    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << ' ' << units[0];
    } else {
        oss << std::fixed << std::setprecision(2) << value << ' ' << units[unit];
    }
    return oss.str();
}

void print_send_progress(const send_progress& progress) {
    std::cout << "\r[" << progress.filename << "] ";
    if (progress.part_count > 1) {
        std::cout << "part " << progress.part_index << "/" << progress.part_count << " ";
    }
    if (progress.dividing_index && progress.dividing_count) {
        std::cout << "block " << *progress.dividing_index << "/" << *progress.dividing_count << " ";
    }
    std::cout << "chunk " << progress.sequence_index << "/" << progress.sequence_count
              << " | " << std::fixed << std::setprecision(1)
              << progress.completion_percentage() << "% ("
              << format_bytes(progress.bytes_acknowledged) << " / "
              << format_bytes(progress.total_bytes) << ")";
    if (progress.retries > 0) {
        std::cout << " retries " << progress.retries;
    }
    std::cout << std::flush;
}

void print_receive_progress(const receive_progress& progress) {
    std::cout << "\r[" << progress.filename << "] ";
    if (progress.part_count > 1) {
        std::cout << "part " << progress.part_index << "/" << progress.part_count << " ";
    }
    std::cout << "chunk " << progress.sequence_index << "/" << progress.sequence_count
              << " " << to_string(progress.status) << std::flush;
}

auto run_send(channel_interface& channel, const cli_options& options,
              const cancellation_token& token) -> int {
    auto engine = sender_engine::builder()
        .with_config(options.send)
        .build(channel);
    if (!engine) {
        std::cerr << "Error: " << engine.error().message << std::endl;
        return 1;
    }
    engine.value().on_progress(print_send_progress);

    std::cout << "Sending " << options.file.string() << " ..." << std::endl;
    auto summary = engine.value().send(options.file, token);
    std::cout << std::endl;
    if (!summary) {
        if (summary.error().code == error_code::transfer_cancelled) {
            std::cerr << "Cancelled." << std::endl;
            return 130;
        }
        std::cerr << "Error: " << summary.error().message << std::endl;
        return 1;
    }

    const auto& s = summary.value();
    std::cout << "Sent " << s.filename << " (" << format_bytes(s.bytes) << ")\n"
              << "  SHA-256: " << s.content_hash << "\n"
              << "  Parts:   " << s.parts << ", packets: " << s.packets
              << ", retries: " << s.retries << "\n"
              << "  Time:    " << s.elapsed.count() << " ms" << std::endl;
    if (s.archive_type) {
        std::cout << "  Archive: " << *s.archive_type
                  << " (extract on the receiving side)" << std::endl;
    }
    return 0;
}

auto run_receive(channel_interface& channel, const cli_options& options,
                 const cancellation_token& token) -> int {
    auto engine = receiver_engine::builder()
        .with_config(options.receive)
        .build(channel);
    if (!engine) {
        std::cerr << "Error: " << engine.error().message << std::endl;
        return 1;
    }

    engine.value().on_progress(print_receive_progress);
    engine.value().on_transfer_complete([](const transfer_outcome& outcome) {
        std::cout << std::endl;
        if (outcome.verified && outcome.delivered_path) {
            std::cout << "Received " << outcome.filename << " ("
                      << format_bytes(outcome.bytes) << ") -> "
                      << outcome.delivered_path->string() << std::endl;
            if (outcome.archive_type) {
                std::cout << "  Archive: " << *outcome.archive_type
                          << ", extract it to restore the original file" << std::endl;
            }
        } else {
            std::cerr << "Transfer of " << outcome.filename << " failed";
            if (outcome.failure) {
                std::cerr << ": " << outcome.failure->message;
            }
            std::cerr << std::endl;
        }
    });

    std::cout << "Waiting for packets in " << options.receive.output_directory.string()
              << " (Ctrl+C to stop) ..." << std::endl;
    auto summary = engine.value().run(token);
    if (!summary) {
        std::cerr << "Error: " << summary.error().message << std::endl;
        return 1;
    }

    const auto& s = summary.value();
    std::cout << "\nTransfers completed: " << s.transfers_completed
              << ", failed: " << s.transfers_failed
              << ", chunks stored: " << s.chunks_stored
              << ", duplicates: " << s.duplicates << std::endl;
    return s.transfers_failed > 0 ? 1 : 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "clipxfer";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto parsed = parse_cli(args);
    if (!parsed) {
        std::cerr << "Error: " << parsed.error().message << "\n\n" << usage(program);
        return 2;
    }
    const auto& options = parsed.value();

    if (options.command == cli_command::help) {
        std::cout << usage(program);
        return 0;
    }
    if (options.command == cli_command::version) {
        std::cout << "clipxfer " << version::to_string() << std::endl;
        return 0;
    }

    auto& logger = get_logger();
    logger.set_level(options.verbose ? log_level::debug : log_level::warn);
    logger.initialize();

    cancellation_token token;
    g_cancel_flag = token.flag();
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    auto channel = channel_factory::create(options.channel);
    if (!channel) {
        std::cerr << "Error: " << channel.error().message << std::endl;
        logger.shutdown();
        return 1;
    }

    if (options.clear_channel) {
        if (auto cleared = channel.value()->write(""); !cleared) {
            std::cerr << "Warning: could not clear channel: "
                      << cleared.error().message << std::endl;
        }
    }

    int exit_code = options.command == cli_command::send
        ? run_send(*channel.value(), options, token)
        : run_receive(*channel.value(), options, token);

    g_cancel_flag = nullptr;
    logger.shutdown();
    return exit_code;
}
