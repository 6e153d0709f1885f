/**
 * @file scoped_directory.cpp
 * @brief Implementation of scoped_directory
 */

#include <clipxfer/core/scoped_directory.h>

#include <clipxfer/core/logging.h>

#include <random>

namespace clipxfer {

auto random_hex(std::size_t length) -> std::string {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result += hex_chars[dis(gen)];
    }
    return result;
}

scoped_directory::scoped_directory(std::filesystem::path path) : path_(std::move(path)) {}

auto scoped_directory::create(const std::filesystem::path& parent, const std::string& prefix)
    -> result<scoped_directory> {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return unexpected(error{error_code::directory_not_writable,
                                "cannot create directory: " + parent.string()});
    }

    for (int attempt = 0; attempt < 8; ++attempt) {
        auto candidate = parent / (prefix + random_hex(12));
        if (std::filesystem::create_directory(candidate, ec)) {
            return scoped_directory(candidate);
        }
        if (ec) {
            return unexpected(error{error_code::directory_not_writable,
                                    "cannot create directory: " + candidate.string() +
                                        " (" + ec.message() + ")"});
        }
    }

    return unexpected(error{error_code::internal_error,
                            "cannot find a free temporary directory name"});
}

scoped_directory::~scoped_directory() {
    remove();
}

scoped_directory::scoped_directory(scoped_directory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

auto scoped_directory::operator=(scoped_directory&& other) noexcept -> scoped_directory& {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void scoped_directory::remove() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        CX_LOG_WARN(log_category::session,
            "Failed to remove temporary directory " + path_.string() + ": " + ec.message());
    }
    path_.clear();
}

}  // namespace clipxfer
