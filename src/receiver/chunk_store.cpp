/**
 * @file chunk_store.cpp
 * @brief Implementation of the per-chunk file sink
 */

#include <clipxfer/receiver/part_sink.h>

#include <clipxfer/core/logging.h>
#include <clipxfer/core/scoped_directory.h>

#include <fstream>
#include <string>

namespace clipxfer {

namespace {

constexpr std::string_view chunk_extension = ".chunk";

/**
 * @brief Sequence index encoded in a chunk file name, 0 if not a chunk file
 */
auto parse_chunk_name(const std::filesystem::path& file) -> uint64_t {
    if (file.extension().string() != chunk_extension) {
        return 0;
    }
    auto stem = file.stem().string();
    if (stem.empty() || stem.size() > 19) {
        return 0;
    }
    uint64_t value = 0;
    for (char c : stem) {
        if (c < '0' || c > '9') {
            return 0;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

}  // namespace

chunk_store::chunk_store(std::filesystem::path directory, uint64_t sequence_count)
    : directory_(std::move(directory))
    , sequence_count_(sequence_count)
    , chunk_bitmap_(sequence_count, false) {}

auto chunk_store::open(std::filesystem::path directory, uint64_t sequence_count)
    -> result<std::unique_ptr<chunk_store>> {
    if (sequence_count == 0) {
        return unexpected(error{error_code::invalid_chunk_index, "part has no chunks"});
    }

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return unexpected(error{error_code::directory_not_writable,
                                "cannot create chunk directory " + directory.string() + ": " +
                                    ec.message()});
    }

    std::unique_ptr<chunk_store> store(new chunk_store(std::move(directory), sequence_count));

    // Pick up chunks persisted by an earlier run, drop interrupted writes
    std::error_code scan_ec;
    for (const auto& entry : std::filesystem::directory_iterator(store->directory_, scan_ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        auto index = parse_chunk_name(entry.path().filename());
        if (index >= 1 && index <= sequence_count && !store->chunk_bitmap_[index - 1]) {
            store->chunk_bitmap_[index - 1] = true;
            store->received_++;
        } else {
            std::error_code ignored;
            std::filesystem::remove(entry.path(), ignored);
        }
    }
    if (scan_ec) {
        return unexpected(error{error_code::file_read_error,
                                "cannot scan chunk directory: " + scan_ec.message()});
    }

    if (store->received_ > 0) {
        CX_LOG_DEBUG(log_category::session,
                     "Resumed chunk store with " + std::to_string(store->received_) + "/" +
                         std::to_string(sequence_count) + " chunks");
    }
    return store;
}

auto chunk_store::chunk_path(uint64_t sequence_index) const -> std::filesystem::path {
    return directory_ / (std::to_string(sequence_index) + std::string(chunk_extension));
}

auto chunk_store::has_chunk(uint64_t sequence_index) const -> bool {
    if (sequence_index == 0 || sequence_index > sequence_count_) {
        return false;
    }
    return chunk_bitmap_[sequence_index - 1];
}

auto chunk_store::accept(uint64_t sequence_index, std::span<const std::byte> payload)
    -> result<store_status> {
    if (sequence_index == 0 || sequence_index > sequence_count_) {
        return unexpected(error{error_code::invalid_chunk_index,
                                "chunk index " + std::to_string(sequence_index) +
                                    " out of range (count: " + std::to_string(sequence_count_) +
                                    ")"});
    }

    if (chunk_bitmap_[sequence_index - 1]) {
        return store_status::duplicate;
    }

    auto target = chunk_path(sequence_index);
    auto temp_path = target;
    temp_path += ".tmp_" + random_hex(8);

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot create " + temp_path.string()});
        }
        file.write(reinterpret_cast<const char*>(payload.data()),
                   static_cast<std::streamsize>(payload.size()));
        file.flush();
        if (!file) {
            std::error_code ignored;
            file.close();
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
                                "cannot rename chunk file: " + ec.message()});
    }

    chunk_bitmap_[sequence_index - 1] = true;
    received_++;
    return store_status::stored;
}

auto chunk_store::is_complete() const -> bool {
    return received_ == sequence_count_;
}

auto chunk_store::received_count() const -> uint64_t {
    return received_;
}

auto chunk_store::sequence_count() const -> uint64_t {
    return sequence_count_;
}

auto chunk_store::finalize(const std::filesystem::path& part_file) -> result<uint64_t> {
    if (!is_complete()) {
        return unexpected(error{error_code::missing_chunks,
                                std::to_string(sequence_count_ - received_) + " chunks missing"});
    }

    auto temp_path = part_file;
    temp_path += ".tmp_" + random_hex(8);
    uint64_t total = 0;

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot create " + temp_path.string()});
        }

        std::vector<char> buffer(64 * 1024);
        for (uint64_t index = 1; index <= sequence_count_; ++index) {
            std::ifstream in(chunk_path(index), std::ios::binary);
            if (!in) {
                out.close();
                std::error_code ignored;
                std::filesystem::remove(temp_path, ignored);
                return unexpected(error{error_code::missing_chunks,
                                        "chunk " + std::to_string(index) + " vanished"});
            }
            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                auto n = in.gcount();
                if (n > 0) {
                    out.write(buffer.data(), n);
                    total += static_cast<uint64_t>(n);
                }
            }
        }

        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return unexpected(error{error_code::file_write_error,
                                    "cannot write " + temp_path.string()});
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, part_file, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return unexpected(error{error_code::file_write_error,
                                "cannot rename part file: " + ec.message()});
    }

    discard();
    return total;
}

void chunk_store::discard() noexcept {
    std::error_code ec;
    std::filesystem::remove_all(directory_, ec);
}

}  // namespace clipxfer
