/**
 * @file sender_types.h
 * @brief Sender-related type definitions for clipxfer
 */

#ifndef CLIPXFER_SENDER_SENDER_TYPES_H
#define CLIPXFER_SENDER_SENDER_TYPES_H

#include <clipxfer/core/chunk_config.h>
#include <clipxfer/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace clipxfer {

/**
 * @brief Sender configuration
 */
struct sender_config {
    std::size_t chunk_size = chunk_config::default_chunk_size;  // 768KB
    std::optional<std::size_t> dividing_size;  ///< Progress grouping only
    std::optional<uint64_t> part_size;         ///< Pre-split threshold and volume size
    std::chrono::milliseconds poll_interval{200};
    std::chrono::milliseconds ack_timeout{60000};
    std::filesystem::path work_directory = std::filesystem::temp_directory_path();
    bool archive = false;

    [[nodiscard]] auto chunking() const -> chunk_config {
        chunk_config config(chunk_size);
        config.dividing_size = dividing_size;
        return config;
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (auto valid = chunking().validate(); !valid) {
            return valid;
        }
        if (part_size && *part_size == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "part size must be greater than zero"});
        }
        if (poll_interval.count() <= 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "poll interval must be positive"});
        }
        if (ack_timeout < poll_interval) {
            return unexpected(error{error_code::invalid_configuration,
                                    "ACK timeout must not be shorter than the poll interval"});
        }
        if (work_directory.empty()) {
            return unexpected(error{error_code::invalid_configuration,
                                    "work directory must not be empty"});
        }
        return {};
    }
};

/**
 * @brief Position of the sender after an acknowledged packet
 */
struct send_progress {
    std::string filename;
    uint32_t part_index = 1;
    uint32_t part_count = 1;
    std::optional<uint64_t> dividing_index;
    std::optional<uint64_t> dividing_count;
    uint64_t sequence_index = 0;
    uint64_t sequence_count = 0;
    uint64_t bytes_acknowledged = 0;  ///< Across all parts
    uint64_t total_bytes = 0;
    uint64_t retries = 0;             ///< Republications of the current packet

    [[nodiscard]] auto completion_percentage() const -> double {
        if (total_bytes == 0) {
            return 100.0;
        }
        return static_cast<double>(bytes_acknowledged) /
               static_cast<double>(total_bytes) * 100.0;
    }
};

/**
 * @brief Result of a completed send
 */
struct send_summary {
    std::string filename;
    std::string content_hash;
    uint64_t bytes = 0;
    uint32_t parts = 1;
    uint64_t packets = 0;
    uint64_t retries = 0;
    std::optional<std::string> archive_type;
    std::chrono::milliseconds elapsed{0};
};

}  // namespace clipxfer

#endif  // CLIPXFER_SENDER_SENDER_TYPES_H
