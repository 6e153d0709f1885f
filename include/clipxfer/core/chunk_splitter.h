/**
 * @file chunk_splitter.h
 * @brief Reads a file as a numbered sequence of fixed-size chunks
 */

#ifndef CLIPXFER_CORE_CHUNK_SPLITTER_H
#define CLIPXFER_CORE_CHUNK_SPLITTER_H

#include <clipxfer/core/chunk_config.h>
#include <clipxfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>

namespace clipxfer {

/**
 * @brief One window of a file's bytes with its position in the sequence
 */
struct chunk {
    uint64_t sequence_index = 0;  ///< 1-based
    uint64_t sequence_count = 0;
    uint64_t offset = 0;
    std::optional<uint64_t> dividing_index;  ///< 1-based, set with a dividing size
    std::optional<uint64_t> dividing_count;
    std::vector<std::byte> data;

    [[nodiscard]] auto is_last() const -> bool { return sequence_index == sequence_count; }
};

/**
 * @brief Cuts files into chunks without loading them whole
 *
 * An empty file yields exactly one empty chunk so that it still travels
 * as a packet.
 */
class chunk_splitter {
public:
    /// Open file positioned at the next chunk to read
    class chunk_iterator {
    public:
        [[nodiscard]] auto has_next() const -> bool { return produced_ < total_chunks_; }

        /// Reads the next window; fails past the end or on a short read
        [[nodiscard]] auto next() -> result<chunk>;

        [[nodiscard]] auto produced() const -> uint64_t { return produced_; }
        [[nodiscard]] auto total_chunks() const -> uint64_t { return total_chunks_; }
        [[nodiscard]] auto file_size() const -> uint64_t { return file_size_; }

    private:
        friend class chunk_splitter;

        chunk_iterator(std::ifstream file, const chunk_config& config, uint64_t file_size);

        std::ifstream file_;
        chunk_config config_;
        uint64_t file_size_ = 0;
        uint64_t total_chunks_ = 0;
        uint64_t produced_ = 0;
    };

    chunk_splitter() = default;
    explicit chunk_splitter(const chunk_config& config) : config_(config) {}

    [[nodiscard]] auto split(const std::filesystem::path& file_path) -> result<chunk_iterator>;

    [[nodiscard]] auto config() const -> const chunk_config& { return config_; }

private:
    chunk_config config_;
};

}  // namespace clipxfer

#endif  // CLIPXFER_CORE_CHUNK_SPLITTER_H
