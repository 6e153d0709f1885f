/**
 * @file chunk_config.h
 * @brief Chunk and dividing sizes used when cutting a file into packets
 */

#ifndef CLIPXFER_CORE_CHUNK_CONFIG_H
#define CLIPXFER_CORE_CHUNK_CONFIG_H

#include <clipxfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace clipxfer {

/**
 * @brief Sizes for the two chunking tiers
 *
 * Every chunk of `chunk_size` bytes becomes one packet. `dividing_size`,
 * when set, only numbers coarser groups of chunks for progress output.
 */
struct chunk_config {
    static constexpr std::size_t default_chunk_size = 768 * 1024;
    static constexpr std::size_t max_chunk_size = 64 * 1024 * 1024;

    std::size_t chunk_size = default_chunk_size;
    std::optional<std::size_t> dividing_size;

    chunk_config() = default;
    explicit chunk_config(std::size_t size) : chunk_size(size) {}
    chunk_config(std::size_t size, std::size_t dividing)
        : chunk_size(size), dividing_size(dividing) {}

    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size == 0 || chunk_size > max_chunk_size) {
            return unexpected(error{error_code::invalid_chunk_size,
                                    "chunk size must be between 1 and " +
                                        std::to_string(max_chunk_size) + " bytes"});
        }
        if (dividing_size.value_or(chunk_size) < chunk_size) {
            return unexpected(error{error_code::invalid_configuration,
                                    "dividing size is smaller than the chunk size"});
        }
        return {};
    }

    /// Windows of chunk_size covering @p file_size bytes; 0 for an empty file
    [[nodiscard]] auto chunk_count(uint64_t file_size) const -> uint64_t {
        return ceil_div(file_size, chunk_size);
    }

    /// Dividing groups covering @p file_size bytes; at least 1
    [[nodiscard]] auto dividing_count(uint64_t file_size) const -> uint64_t {
        if (!dividing_size) {
            return 1;
        }
        auto groups = ceil_div(file_size, *dividing_size);
        return groups == 0 ? 1 : groups;
    }

private:
    static constexpr auto ceil_div(uint64_t total, uint64_t step) -> uint64_t {
        return total / step + (total % step != 0 ? 1 : 0);
    }
};

}  // namespace clipxfer

#endif  // CLIPXFER_CORE_CHUNK_CONFIG_H
