/**
 * @file codec.cpp
 * @brief Implementation of the packet codec
 */

#include <clipxfer/codec/codec.h>

#include <clipxfer/codec/base64.h>
#include <clipxfer/codec/flat_json.h>
#include <clipxfer/core/checksum.h>

#include <cstdint>

namespace clipxfer {

namespace {

using flat_json::find_string;
using flat_json::find_uint;
using flat_json::has_key;

auto invalid(const std::string& reason) -> unexpected {
    return unexpected(error{error_code::invalid_packet, reason});
}

/// A bare file name: no directory components, nothing that escapes a directory
auto is_safe_filename(const std::string& name) -> bool {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    for (char c : name) {
        if (c == '/' || c == '\\' || c == '\0') {
            return false;
        }
    }
    return true;
}

/// Reads an optional index/count pair: both absent, or 1 <= index <= count
auto read_position(const flat_json::object& obj,
                   std::string_view index_key,
                   std::string_view count_key,
                   std::optional<uint64_t>& index,
                   std::optional<uint64_t>& count) -> bool {
    bool has_index = has_key(obj, index_key);
    bool has_count = has_key(obj, count_key);
    if (!has_index && !has_count) {
        return true;
    }
    index = find_uint(obj, index_key);
    count = find_uint(obj, count_key);
    return index && count && *index >= 1 && *index <= *count;
}

}  // namespace

// ============================================================================
// codec
// ============================================================================

auto codec::encode(const packet& p) -> std::string {
    flat_json::writer out;
    out.field("type", "data")
       .field("v", static_cast<uint64_t>(p.version))
       .field("file", p.base_filename)
       .field("sha256", p.content_hash);
    if (p.part_index && p.part_count) {
        out.field("part", static_cast<uint64_t>(*p.part_index))
           .field("part_count", static_cast<uint64_t>(*p.part_count));
    }
    if (p.part_filename) {
        out.field("part_file", *p.part_filename);
    }
    if (p.dividing_index && p.dividing_count) {
        out.field("div", *p.dividing_index).field("div_count", *p.dividing_count);
    }
    out.field("seq", p.sequence_index).field("seq_count", p.sequence_count);
    if (p.archive_type) {
        out.field("archive", *p.archive_type);
    }
    out.verbatim("payload", base64::encode(p.payload));
    return out.str();
}

auto codec::decode(std::string_view text) -> result<packet> {
    auto parsed = flat_json::parse(text);
    if (!parsed) {
        return unexpected(parsed.error());
    }
    const auto& obj = parsed.value();

    if (find_string(obj, "type") != "data") {
        return invalid("not a data packet");
    }

    auto version = find_uint(obj, "v");
    if (!version) {
        return invalid("missing version");
    }
    if (*version != wire_version) {
        return unexpected(error{error_code::unsupported_version,
                                "wire version " + std::to_string(*version) + " not supported"});
    }

    packet p;
    p.version = static_cast<uint32_t>(*version);

    auto file = find_string(obj, "file");
    if (!file || !is_safe_filename(*file)) {
        return invalid("missing or unsafe file name");
    }
    p.base_filename = std::move(*file);

    auto hash = find_string(obj, "sha256");
    if (!hash || !checksum::is_sha256_hex(*hash)) {
        return invalid("missing or malformed sha256");
    }
    p.content_hash = std::move(*hash);

    auto seq = find_uint(obj, "seq");
    auto seq_count = find_uint(obj, "seq_count");
    if (!seq || !seq_count || *seq < 1 || *seq > *seq_count) {
        return invalid("missing or inconsistent sequence position");
    }
    if (*seq_count > max_sequence_count) {
        return invalid("sequence count " + std::to_string(*seq_count) + " exceeds " +
                       std::to_string(max_sequence_count));
    }
    p.sequence_index = *seq;
    p.sequence_count = *seq_count;

    std::optional<uint64_t> part;
    std::optional<uint64_t> part_count;
    if (!read_position(obj, "part", "part_count", part, part_count) ||
        (part_count && *part_count > max_part_count)) {
        return invalid("inconsistent part position");
    }
    if (part) {
        p.part_index = static_cast<uint32_t>(*part);
        p.part_count = static_cast<uint32_t>(*part_count);
    }

    if (!read_position(obj, "div", "div_count", p.dividing_index, p.dividing_count)) {
        return invalid("inconsistent dividing position");
    }

    if (has_key(obj, "part_file")) {
        auto part_file = find_string(obj, "part_file");
        if (!part_file || !is_safe_filename(*part_file)) {
            return invalid("unsafe part file name");
        }
        p.part_filename = std::move(*part_file);
    }

    if (has_key(obj, "archive")) {
        auto archive = find_string(obj, "archive");
        if (!archive) {
            return invalid("archive type must be a string");
        }
        p.archive_type = std::move(*archive);
    }

    auto payload = find_string(obj, "payload");
    if (!payload) {
        return invalid("missing payload");
    }
    auto bytes = base64::decode(*payload);
    if (!bytes) {
        return unexpected(bytes.error());
    }
    p.payload = std::move(bytes.value());

    return p;
}

auto codec::encode_ack(const ack_token& ack) -> std::string {
    flat_json::writer out;
    out.field("type", "ack").field("tag", ack.transfer_tag);
    if (ack.part_index) {
        out.field("part", static_cast<uint64_t>(*ack.part_index));
    }
    out.field("seq", ack.sequence_index);
    return out.str();
}

auto codec::decode_ack(std::string_view text) -> result<ack_token> {
    auto parsed = flat_json::parse(text);
    if (!parsed) {
        return unexpected(error{error_code::invalid_ack, parsed.error().message});
    }
    const auto& obj = parsed.value();

    if (find_string(obj, "type") != "ack") {
        return unexpected(error{error_code::invalid_ack, "not an acknowledgement"});
    }

    ack_token ack;
    auto tag = find_string(obj, "tag");
    if (!tag || tag->empty()) {
        return unexpected(error{error_code::invalid_ack, "missing transfer tag"});
    }
    ack.transfer_tag = std::move(*tag);

    auto seq = find_uint(obj, "seq");
    if (!seq || *seq < 1) {
        return unexpected(error{error_code::invalid_ack, "missing sequence index"});
    }
    ack.sequence_index = *seq;

    if (has_key(obj, "part")) {
        auto part = find_uint(obj, "part");
        if (!part || *part < 1 || *part > UINT32_MAX) {
            return unexpected(error{error_code::invalid_ack, "bad part index"});
        }
        ack.part_index = static_cast<uint32_t>(*part);
    }

    return ack;
}

auto codec::ack_for(const packet& p) -> ack_token {
    ack_token ack;
    ack.transfer_tag = p.transfer_tag();
    if (p.part_index && p.part_count) {
        ack.part_index = p.part_index;
    }
    ack.sequence_index = p.sequence_index;
    return ack;
}

}  // namespace clipxfer
