/**
 * @file codec.h
 * @brief Framing of packets and acknowledgements as channel text
 */

#ifndef CLIPXFER_CODEC_CODEC_H
#define CLIPXFER_CODEC_CODEC_H

#include <clipxfer/codec/packet.h>
#include <clipxfer/core/types.h>

#include <string>
#include <string_view>

namespace clipxfer {

/**
 * @brief Packet and acknowledgement codec
 *
 * Both records are single-line JSON objects of printable ASCII,
 * discriminated by their `type` field (`data` or `ack`), so neither side
 * can take its own echo for the other's message.
 *
 * @code
 * {"type":"data","v":1,"file":"a.bin","sha256":"...","seq":1,"seq_count":3,"payload":"..."}
 * {"type":"ack","tag":"0123456789abcdef","seq":1}
 * @endcode
 *
 * Decode failures are ordinary: the channel routinely holds the other
 * side's tokens or unrelated clipboard content.
 */
class codec {
public:
    /**
     * @brief Encode a packet
     */
    [[nodiscard]] static auto encode(const packet& p) -> std::string;

    /**
     * @brief Decode a packet
     * @return Packet, or invalid_packet / unsupported_version
     */
    [[nodiscard]] static auto decode(std::string_view text) -> result<packet>;

    /**
     * @brief Encode an acknowledgement
     */
    [[nodiscard]] static auto encode_ack(const ack_token& ack) -> std::string;

    /**
     * @brief Decode an acknowledgement
     * @return Token, or invalid_ack
     */
    [[nodiscard]] static auto decode_ack(std::string_view text) -> result<ack_token>;

    /**
     * @brief Acknowledgement identifying a packet
     */
    [[nodiscard]] static auto ack_for(const packet& p) -> ack_token;
};

}  // namespace clipxfer

#endif  // CLIPXFER_CODEC_CODEC_H
