/**
 * @file file_partitioner.h
 * @brief Pre-splitting of an artifact into on-disk part files
 */

#ifndef CLIPXFER_CORE_FILE_PARTITIONER_H
#define CLIPXFER_CORE_FILE_PARTITIONER_H

#include <clipxfer/core/types.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace clipxfer {

/**
 * @brief Splits a file into numbered volumes and joins them back
 *
 * Volumes are named `<name>.001`, `<name>.002`, ... the way multi-volume
 * archivers name them. The receiver does not rely on the names: each
 * packet carries its part index explicitly.
 */
class file_partitioner {
public:
    /**
     * @brief Name of the n-th volume (1-based) of a file
     */
    [[nodiscard]] static auto part_name(const std::string& base_name, uint32_t index)
        -> std::string;

    /**
     * @brief Split a file into parts of at most part_size bytes
     * @param source File to split
     * @param part_size Maximum part size in bytes (> 0)
     * @param output_dir Directory receiving the parts
     * @return Part paths in order, or error
     *
     * An empty file produces a single empty part.
     */
    [[nodiscard]] static auto split(
        const std::filesystem::path& source,
        uint64_t part_size,
        const std::filesystem::path& output_dir) -> result<std::vector<std::filesystem::path>>;

    /**
     * @brief Concatenate files in the given order
     * @param parts Files to concatenate
     * @param destination Output file (truncated)
     * @return Number of bytes written, or error
     */
    [[nodiscard]] static auto join(
        const std::vector<std::filesystem::path>& parts,
        const std::filesystem::path& destination) -> result<uint64_t>;
};

}  // namespace clipxfer

#endif  // CLIPXFER_CORE_FILE_PARTITIONER_H
