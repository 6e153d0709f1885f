/**
 * @file checksum.h
 * @brief Whole-artifact integrity digest
 */

#ifndef CLIPXFER_CORE_CHECKSUM_H
#define CLIPXFER_CORE_CHECKSUM_H

#include <clipxfer/core/types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace clipxfer {

/**
 * @brief SHA-256 utilities
 *
 * The digest of the pre-chunking artifact is the only correctness oracle
 * of a transfer: the sender computes it once before chunking and the
 * receiver recomputes it over the reassembled file.
 */
class checksum {
public:
    /// Length of a hex encoded SHA-256 digest
    static constexpr std::size_t sha256_hex_length = 64;

    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return SHA-256 hash as lowercase hex string
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return SHA-256 hash as lowercase hex string, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Verify SHA-256 hash of a file
     * @param path Path to the file
     * @param expected Expected hash as hex string (case-insensitive)
     * @return true if hash matches, false otherwise
     */
    [[nodiscard]] static auto verify_sha256(
        const std::filesystem::path& path, const std::string& expected) -> bool;

    /**
     * @brief Check that a string looks like a hex SHA-256 digest
     */
    [[nodiscard]] static auto is_sha256_hex(const std::string& value) -> bool;
};

}  // namespace clipxfer

#endif  // CLIPXFER_CORE_CHECKSUM_H
