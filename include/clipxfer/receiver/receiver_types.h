/**
 * @file receiver_types.h
 * @brief Receiver-related type definitions for clipxfer
 */

#ifndef CLIPXFER_RECEIVER_RECEIVER_TYPES_H
#define CLIPXFER_RECEIVER_RECEIVER_TYPES_H

#include <clipxfer/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace clipxfer {

/**
 * @brief How received chunks are held until their part is complete
 */
enum class receive_mode {
    chunk_store,  ///< One file per chunk, any arrival order
    streaming     ///< Appended to the part file in strict sequence order
};

[[nodiscard]] constexpr auto to_string(receive_mode mode) -> const char* {
    switch (mode) {
        case receive_mode::chunk_store: return "chunk_store";
        case receive_mode::streaming: return "streaming";
        default: return "unknown";
    }
}

/**
 * @brief Receiver configuration
 */
struct receiver_config {
    std::filesystem::path output_directory;
    std::filesystem::path work_directory =
        std::filesystem::temp_directory_path() / "clipxfer_receive";
    std::chrono::milliseconds poll_interval{200};
    bool exit_after_one_transfer = false;
    receive_mode mode = receive_mode::chunk_store;
    bool resume = true;  ///< Reuse chunks persisted by an earlier run

    [[nodiscard]] auto validate() const -> result<void> {
        if (output_directory.empty()) {
            return unexpected(error{error_code::invalid_configuration,
                                    "output directory must be set"});
        }
        if (work_directory.empty()) {
            return unexpected(error{error_code::invalid_configuration,
                                    "work directory must not be empty"});
        }
        if (poll_interval.count() <= 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "poll interval must be positive"});
        }
        return {};
    }
};

/**
 * @brief Receiver session lifecycle
 */
enum class session_state {
    receiving,
    reassembling_part,
    reassembling_final,
    verified,
    failed
};

[[nodiscard]] constexpr auto to_string(session_state state) -> const char* {
    switch (state) {
        case session_state::receiving: return "receiving";
        case session_state::reassembling_part: return "reassembling_part";
        case session_state::reassembling_final: return "reassembling_final";
        case session_state::verified: return "verified";
        case session_state::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief What a part sink did with a chunk
 */
enum class store_status {
    stored,     ///< New data, persisted
    duplicate,  ///< Already held
    discarded   ///< Out of order for a streaming sink, bytes dropped
};

[[nodiscard]] constexpr auto to_string(store_status status) -> const char* {
    switch (status) {
        case store_status::stored: return "stored";
        case store_status::duplicate: return "duplicate";
        case store_status::discarded: return "discarded";
        default: return "unknown";
    }
}

/**
 * @brief What the receiver did with one polled channel value
 */
enum class poll_outcome {
    no_change,           ///< Empty or identical to the last value seen
    ignored,             ///< Not a packet
    stored,              ///< New chunk persisted and acknowledged
    duplicate,           ///< Known chunk acknowledged again
    discarded,           ///< Out-of-order chunk acknowledged, bytes dropped
    storage_error,       ///< Chunk could not be persisted, no ACK sent
    transfer_completed,  ///< Last chunk arrived and the artifact was delivered
    transfer_failed      ///< Last chunk arrived and verification failed
};

[[nodiscard]] constexpr auto to_string(poll_outcome outcome) -> const char* {
    switch (outcome) {
        case poll_outcome::no_change: return "no_change";
        case poll_outcome::ignored: return "ignored";
        case poll_outcome::stored: return "stored";
        case poll_outcome::duplicate: return "duplicate";
        case poll_outcome::discarded: return "discarded";
        case poll_outcome::storage_error: return "storage_error";
        case poll_outcome::transfer_completed: return "transfer_completed";
        case poll_outcome::transfer_failed: return "transfer_failed";
        default: return "unknown";
    }
}

/**
 * @brief Receiver position after an acknowledged packet
 */
struct receive_progress {
    std::string filename;
    uint32_t part_index = 1;
    uint32_t part_count = 1;
    uint64_t sequence_index = 0;
    uint64_t sequence_count = 0;
    store_status status = store_status::stored;
};

/**
 * @brief Final state of one transfer
 */
struct transfer_outcome {
    std::string filename;
    std::string expected_hash;
    std::string actual_hash;
    bool verified = false;
    std::optional<std::filesystem::path> delivered_path;
    uint64_t bytes = 0;
    std::optional<std::string> archive_type;
    std::optional<error> failure;
};

/**
 * @brief Counters of a receiver run
 */
struct receive_summary {
    uint64_t transfers_completed = 0;
    uint64_t transfers_failed = 0;
    uint64_t chunks_stored = 0;
    uint64_t duplicates = 0;
    uint64_t discarded = 0;
    bool cancelled = false;
};

}  // namespace clipxfer

#endif  // CLIPXFER_RECEIVER_RECEIVER_TYPES_H
