/**
 * @file flat_json.cpp
 * @brief Strict parser and writer for one-level JSON objects
 */

#include <clipxfer/codec/flat_json.h>

#include <charconv>
#include <iomanip>
#include <sstream>

namespace clipxfer::flat_json {

namespace {

auto invalid(const std::string& reason) -> unexpected {
    return unexpected(error{error_code::invalid_packet, reason});
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

void append_u_escape(std::ostringstream& o, uint32_t unit) {
    o << "\\u" << std::hex << std::setw(4) << std::setfill('0') << unit << std::dec;
}

/// Next code point of a UTF-8 string; invalid bytes decode as themselves
auto next_code_point(const std::string& s, std::size_t& i) -> uint32_t {
    auto lead = static_cast<unsigned char>(s[i]);
    std::size_t extra = 0;
    uint32_t cp = lead;
    if (lead >= 0xF0 && lead < 0xF8) {
        extra = 3;
        cp = lead & 0x07;
    } else if (lead >= 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
    } else if (lead >= 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
    }

    if (extra == 0 || i + extra >= s.size()) {
        ++i;
        return lead;
    }

    for (std::size_t k = 1; k <= extra; ++k) {
        auto cont = static_cast<unsigned char>(s[i + k]);
        if ((cont & 0xC0) != 0x80) {
            ++i;
            return lead;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    i += extra + 1;
    return cp;
}

auto escape_string(const std::string& s) -> std::string {
    std::ostringstream o;
    std::size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            switch (c) {
                case '"': o << "\\\""; break;
                case '\\': o << "\\\\"; break;
                case '\b': o << "\\b"; break;
                case '\f': o << "\\f"; break;
                case '\n': o << "\\n"; break;
                case '\r': o << "\\r"; break;
                case '\t': o << "\\t"; break;
                default:
                    if (c < 0x20 || c == 0x7F) {
                        append_u_escape(o, c);
                    } else {
                        o << static_cast<char>(c);
                    }
            }
            ++i;
            continue;
        }

        uint32_t cp = next_code_point(s, i);
        if (cp >= 0x10000) {
            cp -= 0x10000;
            append_u_escape(o, 0xD800 + (cp >> 10));
            append_u_escape(o, 0xDC00 + (cp & 0x3FF));
        } else {
            append_u_escape(o, cp);
        }
    }
    return o.str();
}

class parser {
public:
    explicit parser(std::string_view text) : text_(text) {}

    auto parse() -> result<object> {
        object object;
        skip_ws();
        if (!consume('{')) {
            return invalid("not a JSON object");
        }
        skip_ws();
        if (consume('}')) {
            return finish(std::move(object));
        }

        while (true) {
            skip_ws();
            auto key = parse_string();
            if (!key) {
                return unexpected(key.error());
            }
            skip_ws();
            if (!consume(':')) {
                return invalid("expected ':'");
            }
            skip_ws();

            scalar value;
            if (peek() == '"') {
                auto str = parse_string();
                if (!str) {
                    return unexpected(str.error());
                }
                value.is_string = true;
                value.text = std::move(str.value());
            } else {
                auto num = parse_number();
                if (!num) {
                    return unexpected(num.error());
                }
                value.text = std::move(num.value());
            }

            if (!object.emplace(std::move(key.value()), std::move(value)).second) {
                return invalid("duplicate key");
            }

            skip_ws();
            if (consume(',')) {
                continue;
            }
            if (consume('}')) {
                return finish(std::move(object));
            }
            return invalid("expected ',' or '}'");
        }
    }

private:
    auto finish(object parsed) -> result<object> {
        skip_ws();
        if (pos_ != text_.size()) {
            return invalid("trailing characters after object");
        }
        return parsed;
    }

    [[nodiscard]] auto peek() const -> char { return pos_ < text_.size() ? text_[pos_] : '\0'; }

    auto consume(char c) -> bool {
        if (peek() == c && pos_ < text_.size()) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skip_ws() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\n' || text_[pos_] == '\r' ||
                text_[pos_] == '\t')) {
            ++pos_;
        }
    }

    auto parse_hex4() -> result<uint32_t> {
        if (pos_ + 4 > text_.size()) {
            return invalid("truncated \\u escape");
        }
        uint32_t unit = 0;
        auto first = text_.data() + pos_;
        auto [ptr, ec] = std::from_chars(first, first + 4, unit, 16);
        if (ec != std::errc{} || ptr != first + 4) {
            return invalid("bad \\u escape");
        }
        pos_ += 4;
        return unit;
    }

    auto parse_string() -> result<std::string> {
        if (!consume('"')) {
            return invalid("expected string");
        }
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return invalid("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) {
                break;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    auto unit = parse_hex4();
                    if (!unit) {
                        return unexpected(unit.error());
                    }
                    uint32_t cp = unit.value();
                    if (cp >= 0xD800 && cp < 0xDC00) {
                        if (!(consume('\\') && consume('u'))) {
                            return invalid("unpaired surrogate");
                        }
                        auto low = parse_hex4();
                        if (!low || low.value() < 0xDC00 || low.value() >= 0xE000) {
                            return invalid("unpaired surrogate");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low.value() - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    return invalid("bad escape sequence");
            }
        }
        return invalid("unterminated string");
    }

    auto parse_number() -> result<std::string> {
        auto start = pos_;
        while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
            ++pos_;
        }
        if (pos_ == start) {
            return invalid("expected string or unsigned integer");
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // namespace

auto parse(std::string_view text) -> result<object> {
    return parser(text).parse();
}

auto escape(const std::string& value) -> std::string {
    return escape_string(value);
}

auto find_string(const object& obj, std::string_view key) -> std::optional<std::string> {
    auto it = obj.find(key);
    if (it == obj.end() || !it->second.is_string) {
        return std::nullopt;
    }
    return it->second.text;
}

auto find_uint(const object& obj, std::string_view key) -> std::optional<uint64_t> {
    auto it = obj.find(key);
    if (it == obj.end() || it->second.is_string) {
        return std::nullopt;
    }
    const auto& text = it->second.text;
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto has_key(const object& obj, std::string_view key) -> bool {
    return obj.find(key) != obj.end();
}

auto writer::key(std::string_view name) -> std::string& {
    if (text_.size() > 1) {
        text_ += ',';
    }
    text_ += '"';
    text_ += name;
    text_ += "\":";
    return text_;
}

auto writer::field(std::string_view name, const std::string& value) -> writer& {
    key(name) += '"' + escape(value) + '"';
    return *this;
}

auto writer::field(std::string_view name, const char* value) -> writer& {
    return field(name, std::string(value));
}

auto writer::field(std::string_view name, uint64_t value) -> writer& {
    key(name) += std::to_string(value);
    return *this;
}

auto writer::verbatim(std::string_view name, std::string_view value) -> writer& {
    auto& text = key(name);
    text += '"';
    text += value;
    text += '"';
    return *this;
}

}  // namespace clipxfer::flat_json
