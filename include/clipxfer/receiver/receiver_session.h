/**
 * @file receiver_session.h
 * @brief Receiver state of one transfer
 */

#ifndef CLIPXFER_RECEIVER_RECEIVER_SESSION_H
#define CLIPXFER_RECEIVER_RECEIVER_SESSION_H

#include <clipxfer/codec/packet.h>
#include <clipxfer/core/types.h>
#include <clipxfer/receiver/part_sink.h>
#include <clipxfer/receiver/receiver_types.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clipxfer {

/**
 * @brief Where and how a session keeps its temporary state
 */
struct session_options {
    std::filesystem::path work_root;  ///< Parent of all session directories
    receive_mode mode = receive_mode::chunk_store;
    bool resume = true;
};

/**
 * @brief Effect of one accepted packet on the session
 *
 * `part_completed` and `transfer_ready` are each reported by exactly one
 * call: the one whose chunk completed the part, or the last part.
 */
struct accept_result {
    store_status status = store_status::stored;
    bool part_completed = false;
    bool transfer_ready = false;
};

/**
 * @brief One transfer tracked by the receiver
 *
 * Created from the first packet of a transfer and moved through
 * receiving -> reassembling_part -> ... -> reassembling_final ->
 * verified | failed. A session is never reused for another transfer.
 *
 * Temporary state lives in `<work_root>/<content hash>/`:
 * - `session.json`: identity and per-part chunk counts
 * - `part_NNN/`: chunk files of an incomplete part (chunk_store mode)
 * - `part_NNN.stream`: in-order stream of an incomplete part (streaming mode)
 * - `part_NNN.bin`: reassembled part
 *
 * With resume enabled a directory left by an earlier run for the same
 * transfer is picked up instead of being cleared.
 */
class receiver_session {
public:
    /**
     * @brief Open a session for the transfer a packet belongs to
     * @param first First packet observed
     * @param options Storage options
     * @return Session, or error if its directory cannot be prepared
     */
    [[nodiscard]] static auto open(const packet& first, const session_options& options)
        -> result<std::unique_ptr<receiver_session>>;

    ~receiver_session();

    receiver_session(const receiver_session&) = delete;
    auto operator=(const receiver_session&) -> receiver_session& = delete;

    /**
     * @brief Check whether a packet belongs to this transfer
     */
    [[nodiscard]] auto matches(const packet& p) const -> bool;

    /**
     * @brief Store a packet's chunk and advance the state machine
     * @return Effect of the packet, or error (nothing is acknowledged then)
     *
     * Returns session_mismatch when the packet disagrees with the chunk
     * layout already recorded for its part.
     */
    [[nodiscard]] auto accept(const packet& p) -> result<accept_result>;

    /**
     * @brief Concatenate the reassembled parts in part order
     * @param destination Output file (truncated)
     * @return Bytes written, or error
     */
    [[nodiscard]] auto reassemble(const std::filesystem::path& destination) -> result<uint64_t>;

    /**
     * @brief Record the verification verdict
     */
    void finish(bool verified);

    /**
     * @brief Delete the session directory
     */
    void discard() noexcept;

    [[nodiscard]] auto state() const -> session_state { return state_; }

    [[nodiscard]] auto base_filename() const -> const std::string& { return base_filename_; }

    [[nodiscard]] auto content_hash() const -> const std::string& { return content_hash_; }

    [[nodiscard]] auto archive_type() const -> const std::optional<std::string>& {
        return archive_type_;
    }

    [[nodiscard]] auto part_count() const -> uint32_t { return part_count_; }

    [[nodiscard]] auto completed_parts() const -> uint32_t;

    [[nodiscard]] auto is_part_complete(uint32_t part_index) const -> bool;

    /**
     * @brief Chunks held for an incomplete part
     */
    [[nodiscard]] auto received_in_part(uint32_t part_index) const -> uint64_t;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return directory_; }

    /**
     * @brief Whether state persisted by an earlier run was picked up
     */
    [[nodiscard]] auto resumed() const -> bool { return resumed_; }

private:
    receiver_session(const packet& first, const session_options& options);

    [[nodiscard]] auto part_file(uint32_t part_index) const -> std::filesystem::path;
    [[nodiscard]] auto sink_path(uint32_t part_index) const -> std::filesystem::path;
    [[nodiscard]] auto sink_for(uint32_t part_index) -> result<part_sink*>;
    [[nodiscard]] auto complete_part(uint32_t part_index) -> result<void>;
    [[nodiscard]] auto all_parts_complete() const -> bool;
    [[nodiscard]] auto save_manifest() const -> result<void>;
    [[nodiscard]] auto load_manifest() -> bool;

    std::string base_filename_;
    std::string content_hash_;
    std::optional<std::string> archive_type_;
    uint32_t part_count_;
    session_options options_;
    std::filesystem::path directory_;
    session_state state_ = session_state::receiving;
    bool resumed_ = false;

    std::vector<uint64_t> sequence_counts_;  ///< 0 until a part's first packet
    std::vector<bool> part_bitmap_;
    std::map<uint32_t, std::unique_ptr<part_sink>> sinks_;
};

}  // namespace clipxfer

#endif  // CLIPXFER_RECEIVER_RECEIVER_SESSION_H
