/**
 * @file chunk_splitter.cpp
 * @brief Implementation of chunk_splitter and its streaming chunk_iterator
 */

#include <clipxfer/core/chunk_splitter.h>

#include <algorithm>
#include <string>

namespace clipxfer {

chunk_splitter::chunk_iterator::chunk_iterator(std::ifstream file,
                                               const chunk_config& config,
                                               uint64_t file_size)
    : file_(std::move(file)),
      config_(config),
      file_size_(file_size),
      total_chunks_(std::max<uint64_t>(config.chunk_count(file_size), 1)) {}

auto chunk_splitter::chunk_iterator::next() -> result<chunk> {
    if (!has_next()) {
        return unexpected(error{error_code::invalid_chunk_index,
                                "all " + std::to_string(total_chunks_) + " chunks already read"});
    }

    chunk out;
    out.sequence_index = produced_ + 1;
    out.sequence_count = total_chunks_;
    out.offset = produced_ * config_.chunk_size;
    if (config_.dividing_size) {
        out.dividing_index = out.offset / *config_.dividing_size + 1;
        out.dividing_count = config_.dividing_count(file_size_);
    }

    const auto want = std::min<uint64_t>(config_.chunk_size, file_size_ - out.offset);
    out.data.resize(static_cast<std::size_t>(want));
    if (want > 0 &&
        !file_.read(reinterpret_cast<char*>(out.data.data()), static_cast<std::streamsize>(want))) {
        return unexpected(error{error_code::file_read_error,
                                "short read at offset " + std::to_string(out.offset)});
    }

    ++produced_;
    return out;
}

auto chunk_splitter::split(const std::filesystem::path& file_path) -> result<chunk_iterator> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return unexpected(
            error{error_code::file_not_found, "not a regular file: " + file_path.string()});
    }
    const auto size = std::filesystem::file_size(file_path, ec);
    std::ifstream file(file_path, std::ios::binary);
    if (ec || !file) {
        return unexpected(
            error{error_code::file_access_denied, "cannot open " + file_path.string()});
    }

    return chunk_iterator(std::move(file), config_, size);
}

}  // namespace clipxfer
