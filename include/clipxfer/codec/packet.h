/**
 * @file packet.h
 * @brief Wire-level records exchanged over the shared channel
 */

#ifndef CLIPXFER_CODEC_PACKET_H
#define CLIPXFER_CODEC_PACKET_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clipxfer {

/// Current wire format version
inline constexpr uint32_t wire_version = 1;

/// Parts per transfer; volume suffixes have three digits
inline constexpr uint32_t max_part_count = 999;

/// Chunks per part accepted from the channel
inline constexpr uint64_t max_sequence_count = uint64_t{1} << 24;

/// Number of content hash hex digits carried by acknowledgements
inline constexpr std::size_t transfer_tag_length = 16;

/**
 * @brief One chunk in flight, with the metadata of its transfer
 *
 * `content_hash` is the SHA-256 of the whole pre-chunking artifact and is
 * identical on every packet of a transfer. `sequence_index` is 1-based and
 * strictly increasing within a part.
 */
struct packet {
    uint32_t version = wire_version;
    std::string base_filename;
    std::string content_hash;
    std::optional<uint32_t> part_index;
    std::optional<uint32_t> part_count;
    std::optional<std::string> part_filename;
    std::optional<uint64_t> dividing_index;
    std::optional<uint64_t> dividing_count;
    uint64_t sequence_index = 0;
    uint64_t sequence_count = 0;
    std::optional<std::string> archive_type;
    std::vector<std::byte> payload;

    /**
     * @brief Part index, 1 for single-part transfers
     */
    [[nodiscard]] auto effective_part_index() const -> uint32_t {
        return part_index.value_or(1);
    }

    [[nodiscard]] auto effective_part_count() const -> uint32_t {
        return part_count.value_or(1);
    }

    /**
     * @brief Short identifier of the transfer derived from the content hash
     */
    [[nodiscard]] auto transfer_tag() const -> std::string {
        return content_hash.substr(0, transfer_tag_length);
    }
};

/**
 * @brief Acknowledgement of one packet
 *
 * `part_index` is absent in the single-part form.
 */
struct ack_token {
    std::string transfer_tag;
    std::optional<uint32_t> part_index;
    uint64_t sequence_index = 0;

    [[nodiscard]] auto operator==(const ack_token& other) const -> bool = default;
};

}  // namespace clipxfer

#endif  // CLIPXFER_CODEC_PACKET_H
