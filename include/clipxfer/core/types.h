/**
 * @file types.h
 * @brief Error codes and the result type shared by every clipxfer module
 */

#ifndef CLIPXFER_CORE_TYPES_H
#define CLIPXFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace clipxfer {

/**
 * @brief Failure reasons, grouped in ranges by the layer that reports them
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    invalid_file_path = -104,
    file_read_error = -105,
    file_write_error = -106,
    directory_not_writable = -107,

    // Chunk errors (-120 to -139)
    chunk_sequence_error = -121,
    file_hash_mismatch = -123,
    invalid_chunk_index = -124,
    missing_chunks = -125,

    // Configuration errors (-140 to -159)
    invalid_chunk_size = -140,
    invalid_configuration = -141,

    // Channel errors (-160 to -179)
    channel_unavailable = -160,
    channel_read_error = -161,
    channel_write_error = -162,

    // Protocol errors (-180 to -199)
    invalid_packet = -180,
    invalid_ack = -181,
    unsupported_version = -182,
    transfer_cancelled = -183,
    session_mismatch = -184,

    // Archive errors (-200 to -209)
    archiver_not_found = -200,
    archive_failed = -201,

    // Internal errors (-220 to -239)
    internal_error = -220,
    not_initialized = -221,
};

/// Short lowercase description of @p code
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success: return "success";
        case error_code::file_not_found: return "file not found";
        case error_code::file_access_denied: return "file access denied";
        case error_code::invalid_file_path: return "invalid file path";
        case error_code::file_read_error: return "file read error";
        case error_code::file_write_error: return "file write error";
        case error_code::directory_not_writable: return "directory not writable";
        case error_code::chunk_sequence_error: return "chunk sequence error";
        case error_code::file_hash_mismatch: return "file hash mismatch";
        case error_code::invalid_chunk_index: return "invalid chunk index";
        case error_code::missing_chunks: return "missing chunks";
        case error_code::invalid_chunk_size: return "invalid chunk size";
        case error_code::invalid_configuration: return "invalid configuration";
        case error_code::channel_unavailable: return "channel unavailable";
        case error_code::channel_read_error: return "channel read error";
        case error_code::channel_write_error: return "channel write error";
        case error_code::invalid_packet: return "invalid packet";
        case error_code::invalid_ack: return "invalid acknowledgement";
        case error_code::unsupported_version: return "unsupported wire format version";
        case error_code::transfer_cancelled: return "transfer cancelled";
        case error_code::session_mismatch: return "packet does not match session";
        case error_code::archiver_not_found: return "no archiver available";
        case error_code::archive_failed: return "archiving failed";
        case error_code::internal_error: return "internal error";
        case error_code::not_initialized: return "not initialized";
    }
    return "unknown error";
}

/**
 * @brief A failure: what went wrong and a human readable description
 *
 * A default constructed error stands for "no failure".
 */
struct error {
    error_code code{error_code::success};
    std::string message;

    error() = default;
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/// Tags an error so that it converts into a failed result
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

namespace detail {

inline auto no_error() -> const error& {
    static const error none;
    return none;
}

}  // namespace detail

/**
 * @brief Either the value an operation produced or the error it failed with
 *
 * Accessing value() of a failed result throws std::bad_variant_access.
 */
template <typename T>
class result {
public:
    result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    result(unexpected failure) : state_(std::in_place_index<1>, std::move(failure.err)) {}

    [[nodiscard]] auto has_value() const noexcept -> bool { return state_.index() == 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] auto value() & -> T& { return std::get<0>(state_); }
    [[nodiscard]] auto value() const& -> const T& { return std::get<0>(state_); }
    [[nodiscard]] auto value() && -> T&& { return std::get<0>(std::move(state_)); }

    [[nodiscard]] auto error() const -> const struct error& {
        return has_value() ? detail::no_error() : std::get<1>(state_);
    }

private:
    std::variant<T, struct error> state_;
};

/// Outcome of an operation that yields nothing but may fail
template <>
class result<void> {
public:
    result() = default;
    result(unexpected failure) : failure_(std::move(failure.err)) {}

    [[nodiscard]] auto has_value() const noexcept -> bool { return !failure_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] auto error() const -> const struct error& {
        return failure_ ? *failure_ : detail::no_error();
    }

private:
    std::optional<struct error> failure_;
};

}  // namespace clipxfer

#endif  // CLIPXFER_CORE_TYPES_H
