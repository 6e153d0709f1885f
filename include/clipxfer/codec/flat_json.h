/**
 * @file flat_json.h
 * @brief One-level JSON objects whose values are strings or unsigned integers
 *
 * Enough JSON for packets, acknowledgements and the receiver's session
 * manifest. Output is printable ASCII on a single line.
 */

#ifndef CLIPXFER_CODEC_FLAT_JSON_H
#define CLIPXFER_CODEC_FLAT_JSON_H

#include <clipxfer/core/types.h>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace clipxfer::flat_json {

struct scalar {
    bool is_string = false;
    std::string text;  ///< unescaped string, or the digits of a number
};

using object = std::map<std::string, scalar, std::less<>>;

/**
 * @brief Strict parse of a single object
 *
 * Rejects nesting, arrays, signs, fractions, duplicate keys and trailing
 * text. Failures carry error_code::invalid_packet.
 */
[[nodiscard]] auto parse(std::string_view text) -> result<object>;

/// JSON string body for @p value; non-ASCII is written as \u escapes
[[nodiscard]] auto escape(const std::string& value) -> std::string;

[[nodiscard]] auto find_string(const object& obj, std::string_view key)
    -> std::optional<std::string>;
[[nodiscard]] auto find_uint(const object& obj, std::string_view key)
    -> std::optional<uint64_t>;
[[nodiscard]] auto has_key(const object& obj, std::string_view key) -> bool;

/**
 * @brief Appends members to an object in insertion order
 *
 * @code
 * auto text = flat_json::writer().field("type", "ack").field("seq", 3).str();
 * @endcode
 */
class writer {
public:
    auto field(std::string_view key, const std::string& value) -> writer&;
    auto field(std::string_view key, const char* value) -> writer&;
    auto field(std::string_view key, uint64_t value) -> writer&;

    /// For values known to need no escaping, such as base64 text
    auto verbatim(std::string_view key, std::string_view value) -> writer&;

    [[nodiscard]] auto str() const -> std::string { return text_ + '}'; }

private:
    auto key(std::string_view name) -> std::string&;

    std::string text_ = "{";
};

}  // namespace clipxfer::flat_json

#endif  // CLIPXFER_CODEC_FLAT_JSON_H
