/**
 * @file part_sink.h
 * @brief Storage of the chunks of one part until it is complete
 */

#ifndef CLIPXFER_RECEIVER_PART_SINK_H
#define CLIPXFER_RECEIVER_PART_SINK_H

#include <clipxfer/core/types.h>
#include <clipxfer/receiver/receiver_types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

namespace clipxfer {

/**
 * @brief Destination of the chunks of a single part
 *
 * A sink persists a chunk before accept() returns, so the caller may
 * acknowledge it as soon as it does.
 */
class part_sink {
public:
    virtual ~part_sink() = default;

    /**
     * @brief Offer a chunk
     * @param sequence_index 1-based chunk index within the part
     * @param payload Chunk bytes
     * @return What the sink did with the chunk, or error
     */
    [[nodiscard]] virtual auto accept(
        uint64_t sequence_index,
        std::span<const std::byte> payload) -> result<store_status> = 0;

    [[nodiscard]] virtual auto is_complete() const -> bool = 0;

    [[nodiscard]] virtual auto received_count() const -> uint64_t = 0;

    [[nodiscard]] virtual auto sequence_count() const -> uint64_t = 0;

    /**
     * @brief Produce the part file and release temporary storage
     * @param part_file Destination, written atomically
     * @return Part size in bytes, or error (missing_chunks if incomplete)
     */
    [[nodiscard]] virtual auto finalize(const std::filesystem::path& part_file)
        -> result<uint64_t> = 0;

    /**
     * @brief Delete everything the sink persisted
     */
    virtual void discard() noexcept = 0;
};

/**
 * @brief Sink persisting every chunk as `<seq>.chunk` in a directory
 *
 * Chunks may arrive in any order. Completion is tracked with a bitmap;
 * chunks already on disk are picked up again when the store is reopened.
 */
class chunk_store : public part_sink {
public:
    /**
     * @brief Open or create a chunk directory
     * @param directory Directory holding the chunk files
     * @param sequence_count Number of chunks of the part
     */
    [[nodiscard]] static auto open(
        std::filesystem::path directory,
        uint64_t sequence_count) -> result<std::unique_ptr<chunk_store>>;

    [[nodiscard]] auto accept(
        uint64_t sequence_index,
        std::span<const std::byte> payload) -> result<store_status> override;

    [[nodiscard]] auto is_complete() const -> bool override;

    [[nodiscard]] auto received_count() const -> uint64_t override;

    [[nodiscard]] auto sequence_count() const -> uint64_t override;

    [[nodiscard]] auto finalize(const std::filesystem::path& part_file)
        -> result<uint64_t> override;

    void discard() noexcept override;

    [[nodiscard]] auto has_chunk(uint64_t sequence_index) const -> bool;

    [[nodiscard]] auto chunk_path(uint64_t sequence_index) const -> std::filesystem::path;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return directory_; }

private:
    chunk_store(std::filesystem::path directory, uint64_t sequence_count);

    std::filesystem::path directory_;
    uint64_t sequence_count_;
    std::vector<bool> chunk_bitmap_;
    uint64_t received_ = 0;
};

/**
 * @brief Sink appending chunks to the part file in strict order
 *
 * Only the chunk equal to next_expected() is appended. Earlier indices
 * are duplicates and later ones are discarded; the caller acknowledges
 * both, since a serial sender never skips ahead. The append position is
 * recorded in a `.state` file beside the stream so a restarted receiver
 * can continue where it stopped.
 */
class stream_sink : public part_sink {
public:
    /**
     * @brief Open a stream file
     * @param stream_file File the chunks are appended to
     * @param sequence_count Number of chunks of the part
     * @param resume Continue from a recorded position instead of truncating
     */
    [[nodiscard]] static auto open(
        std::filesystem::path stream_file,
        uint64_t sequence_count,
        bool resume) -> result<std::unique_ptr<stream_sink>>;

    [[nodiscard]] auto accept(
        uint64_t sequence_index,
        std::span<const std::byte> payload) -> result<store_status> override;

    [[nodiscard]] auto is_complete() const -> bool override;

    [[nodiscard]] auto received_count() const -> uint64_t override;

    [[nodiscard]] auto sequence_count() const -> uint64_t override;

    [[nodiscard]] auto finalize(const std::filesystem::path& part_file)
        -> result<uint64_t> override;

    void discard() noexcept override;

    [[nodiscard]] auto next_expected() const -> uint64_t { return next_expected_; }

    [[nodiscard]] auto bytes_written() const -> uint64_t { return bytes_written_; }

private:
    stream_sink(std::filesystem::path stream_file, uint64_t sequence_count);

    [[nodiscard]] auto state_path() const -> std::filesystem::path;
    [[nodiscard]] auto save_state() const -> result<void>;

    std::filesystem::path stream_file_;
    uint64_t sequence_count_;
    uint64_t next_expected_ = 1;
    uint64_t bytes_written_ = 0;
};

}  // namespace clipxfer

#endif  // CLIPXFER_RECEIVER_PART_SINK_H
