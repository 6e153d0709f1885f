/**
 * @file base64.h
 * @brief Text-safe encoding of chunk bytes
 */

#ifndef CLIPXFER_CODEC_BASE64_H
#define CLIPXFER_CODEC_BASE64_H

#include <clipxfer/core/types.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace clipxfer::base64 {

/**
 * @brief Standard base64 (RFC 4648) with padding
 */
[[nodiscard]] auto encode(std::span<const std::byte> data) -> std::string;

/**
 * @brief Strict base64 decode
 *
 * Rejects characters outside the alphabet, a length that is not a
 * multiple of four and misplaced padding.
 */
[[nodiscard]] auto decode(std::string_view encoded) -> result<std::vector<std::byte>>;

/**
 * @brief Encoded length for a given number of raw bytes
 */
[[nodiscard]] constexpr auto encoded_size(std::size_t raw_size) -> std::size_t {
    return ((raw_size + 2) / 3) * 4;
}

}  // namespace clipxfer::base64

#endif  // CLIPXFER_CODEC_BASE64_H
