/**
 * @file base64.cpp
 * @brief Standard base64 encoding and strict decoding
 */

#include <clipxfer/codec/base64.h>

#include <array>
#include <cstdint>

namespace clipxfer::base64 {

namespace {

constexpr std::string_view alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int8_t not_base64 = -1;

constexpr auto build_reverse_alphabet() -> std::array<int8_t, 256> {
    std::array<int8_t, 256> table{};
    table.fill(not_base64);
    for (std::size_t i = 0; i < alphabet.size(); ++i) {
        table[static_cast<unsigned char>(alphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto reverse_alphabet = build_reverse_alphabet();

auto byte_at(std::span<const std::byte> data, std::size_t i) -> uint32_t {
    return std::to_integer<uint32_t>(data[i]);
}

void append_group(std::string& out, uint32_t group, std::size_t significant) {
    for (std::size_t k = 0; k < 4; ++k) {
        out += k < significant ? alphabet[(group >> (18 - 6 * k)) & 0x3F] : '=';
    }
}

}  // namespace

auto encode(std::span<const std::byte> data) -> std::string {
    std::string out;
    out.reserve(encoded_size(data.size()));

    const std::size_t whole = data.size() - data.size() % 3;
    for (std::size_t i = 0; i < whole; i += 3) {
        append_group(out, byte_at(data, i) << 16 | byte_at(data, i + 1) << 8 | byte_at(data, i + 2),
                     4);
    }

    switch (data.size() - whole) {
        case 1:
            append_group(out, byte_at(data, whole) << 16, 2);
            break;
        case 2:
            append_group(out, byte_at(data, whole) << 16 | byte_at(data, whole + 1) << 8, 3);
            break;
        default:
            break;
    }
    return out;
}

auto decode(std::string_view encoded) -> result<std::vector<std::byte>> {
    if (encoded.size() % 4 != 0) {
        return unexpected(error{error_code::invalid_packet, "base64 length not a multiple of 4"});
    }

    auto symbols = encoded;
    for (int pad = 0; pad < 2 && !symbols.empty() && symbols.back() == '='; ++pad) {
        symbols.remove_suffix(1);
    }

    std::vector<std::byte> out;
    out.reserve(symbols.size() * 3 / 4);

    uint32_t pending = 0;
    int pending_bits = 0;
    for (char c : symbols) {
        const auto value = reverse_alphabet[static_cast<unsigned char>(c)];
        if (value == not_base64) {
            return unexpected(error{error_code::invalid_packet, "invalid base64 character"});
        }
        pending = pending << 6 | static_cast<uint32_t>(value);
        pending_bits += 6;
        if (pending_bits >= 8) {
            pending_bits -= 8;
            out.push_back(static_cast<std::byte>((pending >> pending_bits) & 0xFF));
        }
    }
    return out;
}

}  // namespace clipxfer::base64
