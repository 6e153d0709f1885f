/**
 * @file stream_sink.cpp
 * @brief Implementation of the in-order streaming sink
 */

#include <clipxfer/receiver/part_sink.h>

#include <clipxfer/core/logging.h>
#include <clipxfer/core/scoped_directory.h>

#include <fstream>
#include <sstream>
#include <string>

namespace clipxfer {

stream_sink::stream_sink(std::filesystem::path stream_file, uint64_t sequence_count)
    : stream_file_(std::move(stream_file)), sequence_count_(sequence_count) {}

auto stream_sink::state_path() const -> std::filesystem::path {
    auto path = stream_file_;
    path += ".state";
    return path;
}

auto stream_sink::save_state() const -> result<void> {
    auto target = state_path();
    auto temp_path = target;
    temp_path += ".tmp_" + random_hex(8);

    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot create " + temp_path.string()});
        }
        file << next_expected_ << ' ' << bytes_written_ << '\n';
        file.flush();
        if (!file) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return unexpected(error{error_code::file_write_error,
                                    "cannot write " + temp_path.string()});
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return unexpected(error{error_code::file_write_error,
                                "cannot rename stream state: " + ec.message()});
    }
    return {};
}

auto stream_sink::open(std::filesystem::path stream_file, uint64_t sequence_count, bool resume)
    -> result<std::unique_ptr<stream_sink>> {
    if (sequence_count == 0) {
        return unexpected(error{error_code::invalid_chunk_index, "part has no chunks"});
    }

    std::error_code ec;
    if (stream_file.has_parent_path()) {
        std::filesystem::create_directories(stream_file.parent_path(), ec);
        if (ec) {
            return unexpected(error{error_code::directory_not_writable,
                                    "cannot create " + stream_file.parent_path().string() +
                                        ": " + ec.message()});
        }
    }

    std::unique_ptr<stream_sink> sink(new stream_sink(std::move(stream_file), sequence_count));

    if (resume) {
        std::ifstream state(sink->state_path());
        uint64_t next = 0;
        uint64_t bytes = 0;
        auto size = std::filesystem::file_size(sink->stream_file_, ec);
        if (state && (state >> next >> bytes) && !ec && next >= 1 &&
            next <= sequence_count + 1 && size >= bytes) {
            // Bytes past the recorded position belong to an unrecorded append
            if (size > bytes) {
                std::filesystem::resize_file(sink->stream_file_, bytes, ec);
            }
            if (!ec) {
                sink->next_expected_ = next;
                sink->bytes_written_ = bytes;
                CX_LOG_DEBUG(log_category::session,
                             "Resumed stream at chunk " + std::to_string(next) + "/" +
                                 std::to_string(sequence_count));
                return sink;
            }
        }
    }

    // Fresh stream
    {
        std::ofstream truncate(sink->stream_file_, std::ios::binary | std::ios::trunc);
        if (!truncate) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot create " + sink->stream_file_.string()});
        }
    }
    if (auto saved = sink->save_state(); !saved) {
        return unexpected(saved.error());
    }
    return sink;
}

auto stream_sink::accept(uint64_t sequence_index, std::span<const std::byte> payload)
    -> result<store_status> {
    if (sequence_index == 0 || sequence_index > sequence_count_) {
        return unexpected(error{error_code::invalid_chunk_index,
                                "chunk index " + std::to_string(sequence_index) +
                                    " out of range (count: " + std::to_string(sequence_count_) +
                                    ")"});
    }

    if (sequence_index < next_expected_) {
        return store_status::duplicate;
    }
    if (sequence_index > next_expected_) {
        return store_status::discarded;
    }

    {
        std::ofstream out(stream_file_, std::ios::binary | std::ios::app);
        if (!out) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot open " + stream_file_.string()});
        }
        out.write(reinterpret_cast<const char*>(payload.data()),
                  static_cast<std::streamsize>(payload.size()));
        out.flush();
        if (!out) {
            out.close();
            // Roll back a partial append
            std::error_code ignored;
            std::filesystem::resize_file(stream_file_, bytes_written_, ignored);
            return unexpected(error{error_code::file_write_error,
                                    "cannot append to " + stream_file_.string()});
        }
    }

    next_expected_++;
    bytes_written_ += payload.size();
    if (auto saved = save_state(); !saved) {
        next_expected_--;
        bytes_written_ -= payload.size();
        std::error_code ignored;
        std::filesystem::resize_file(stream_file_, bytes_written_, ignored);
        return unexpected(saved.error());
    }
    return store_status::stored;
}

auto stream_sink::is_complete() const -> bool {
    return next_expected_ > sequence_count_;
}

auto stream_sink::received_count() const -> uint64_t {
    return next_expected_ - 1;
}

auto stream_sink::sequence_count() const -> uint64_t {
    return sequence_count_;
}

auto stream_sink::finalize(const std::filesystem::path& part_file) -> result<uint64_t> {
    if (!is_complete()) {
        return unexpected(error{error_code::missing_chunks,
                                std::to_string(sequence_count_ - received_count()) +
                                    " chunks missing"});
    }

    std::error_code ec;
    std::filesystem::rename(stream_file_, part_file, ec);
    if (ec) {
        return unexpected(error{error_code::file_write_error,
                                "cannot rename stream file: " + ec.message()});
    }
    std::filesystem::remove(state_path(), ec);
    return bytes_written_;
}

void stream_sink::discard() noexcept {
    std::error_code ec;
    std::filesystem::remove(stream_file_, ec);
    std::filesystem::remove(state_path(), ec);
}

}  // namespace clipxfer
