/**
 * @file file_partitioner.cpp
 * @brief Implementation of on-disk part splitting and joining
 */

#include <clipxfer/core/file_partitioner.h>

#include <clipxfer/core/logging.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace clipxfer {

namespace {

constexpr std::size_t copy_buffer_size = 256 * 1024;

/// Copy up to `limit` bytes from `in` to `out`; returns bytes copied or -1 on write error
auto copy_bytes(std::ifstream& in, std::ofstream& out, uint64_t limit, std::vector<char>& buffer)
    -> int64_t {
    uint64_t copied = 0;
    while (copied < limit && in) {
        auto want = static_cast<std::streamsize>(
            std::min<uint64_t>(buffer.size(), limit - copied));
        in.read(buffer.data(), want);
        auto got = in.gcount();
        if (got <= 0) {
            break;
        }
        out.write(buffer.data(), got);
        if (!out) {
            return -1;
        }
        copied += static_cast<uint64_t>(got);
    }
    return static_cast<int64_t>(copied);
}

}  // namespace

auto file_partitioner::part_name(const std::string& base_name, uint32_t index) -> std::string {
    std::ostringstream oss;
    oss << base_name << '.' << std::setw(3) << std::setfill('0') << index;
    return oss.str();
}

auto file_partitioner::split(
    const std::filesystem::path& source,
    uint64_t part_size,
    const std::filesystem::path& output_dir) -> result<std::vector<std::filesystem::path>> {
    if (part_size == 0) {
        return unexpected(error{error_code::invalid_configuration, "part size must be positive"});
    }

    std::error_code ec;
    auto total = std::filesystem::file_size(source, ec);
    if (ec) {
        return unexpected(
            error{error_code::file_not_found, "cannot stat file: " + source.string()});
    }

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return unexpected(
            error{error_code::file_access_denied, "cannot open file: " + source.string()});
    }

    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        return unexpected(error{error_code::directory_not_writable,
                                "cannot create directory: " + output_dir.string()});
    }

    uint64_t count = total == 0 ? 1 : (total + part_size - 1) / part_size;
    auto base_name = source.filename().string();

    std::vector<std::filesystem::path> parts;
    parts.reserve(static_cast<std::size_t>(count));
    std::vector<char> buffer(copy_buffer_size);

    for (uint64_t i = 0; i < count; ++i) {
        auto part_path = output_dir / part_name(base_name, static_cast<uint32_t>(i + 1));
        std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot create part: " + part_path.string()});
        }

        uint64_t expected = std::min<uint64_t>(part_size, total - i * part_size);
        auto copied = copy_bytes(in, out, expected, buffer);
        if (copied < 0) {
            return unexpected(error{error_code::file_write_error,
                                    "write failed: " + part_path.string()});
        }
        if (static_cast<uint64_t>(copied) != expected) {
            return unexpected(error{error_code::file_read_error,
                                    "short read while splitting: " + source.string()});
        }

        parts.push_back(part_path);
    }

    CX_LOG_DEBUG(log_category::sender,
        "Split " + base_name + " into " + std::to_string(parts.size()) + " parts");
    return parts;
}

auto file_partitioner::join(
    const std::vector<std::filesystem::path>& parts,
    const std::filesystem::path& destination) -> result<uint64_t> {
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected(error{error_code::file_write_error,
                                "cannot create file: " + destination.string()});
    }

    std::vector<char> buffer(copy_buffer_size);
    uint64_t written = 0;

    for (const auto& part : parts) {
        std::ifstream in(part, std::ios::binary);
        if (!in) {
            return unexpected(error{error_code::file_read_error,
                                    "cannot open part: " + part.string()});
        }
        auto copied = copy_bytes(in, out, UINT64_MAX, buffer);
        if (copied < 0) {
            return unexpected(error{error_code::file_write_error,
                                    "write failed: " + destination.string()});
        }
        if (in.bad()) {
            return unexpected(error{error_code::file_read_error,
                                    "read failed: " + part.string()});
        }
        written += static_cast<uint64_t>(copied);
    }

    out.flush();
    if (!out) {
        return unexpected(error{error_code::file_write_error,
                                "flush failed: " + destination.string()});
    }
    return written;
}

}  // namespace clipxfer
