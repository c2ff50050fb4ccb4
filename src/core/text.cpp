/**
 * @file text.cpp
 * @brief Text utility implementations.
 * @author CodeVerdict contributors
 */

#include "core/text.hpp"

#include <array>
#include <cstdint>

namespace code_verdict {

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";
constexpr std::string_view kReplacement = "\xEF\xBF\xBD";  // U+FFFD

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Length of the valid UTF-8 sequence starting at @p pos, or 0 if invalid.
size_t valid_sequence_length(std::string_view bytes, size_t pos) noexcept {
    auto byte = [&](size_t i) { return static_cast<uint8_t>(bytes[i]); };
    const uint8_t lead = byte(pos);
    size_t length = 0;
    uint32_t min_code = 0;

    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) { length = 2; min_code = 0x80; }
    else if ((lead & 0xF0) == 0xE0) { length = 3; min_code = 0x800; }
    else if ((lead & 0xF8) == 0xF0) { length = 4; min_code = 0x10000; }
    else return 0;

    if (pos + length > bytes.size()) return 0;

    uint32_t code = lead & (0x7F >> length);
    for (size_t i = 1; i < length; ++i) {
        if ((byte(pos + i) & 0xC0) != 0x80) return 0;
        code = (code << 6) | (byte(pos + i) & 0x3F);
    }
    if (code < min_code || code > 0x10FFFF) return 0;
    if (code >= 0xD800 && code <= 0xDFFF) return 0;
    return length;
}

}  // namespace

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += kHexDigits[(c >> 4) & 0x0F];
                    out += kHexDigits[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string hex_encode(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char c : bytes) {
        auto b = static_cast<uint8_t>(c);
        out += kHexDigits[b >> 4];
        out += kHexDigits[b & 0x0F];
    }
    return out;
}

std::optional<std::string> hex_decode(std::string_view hex) {
    if (hex.size() % 2 != 0) return std::nullopt;
    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out += static_cast<char>((hi << 4) | lo);
    }
    return out;
}

std::string sanitize_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t pos = 0;
    while (pos < bytes.size()) {
        if (bytes[pos] == '\0') {
            out += kReplacement;
            ++pos;
            continue;
        }
        size_t length = valid_sequence_length(bytes, pos);
        if (length == 0) {
            out += kReplacement;
            ++pos;
        } else {
            out.append(bytes.substr(pos, length));
            pos += length;
        }
    }
    return out;
}

size_t utf8_safe_prefix(std::string_view bytes, size_t limit) noexcept {
    if (limit >= bytes.size()) return bytes.size();
    size_t cut = limit;
    // Back off over continuation bytes (at most three) to the start of the sequence.
    size_t steps = 0;
    while (cut > 0 && steps < 3 && (static_cast<uint8_t>(bytes[cut]) & 0xC0) == 0x80) {
        --cut;
        ++steps;
    }
    return cut;
}

std::string_view trim(std::string_view text) noexcept {
    constexpr std::string_view kSpace = " \t\r\n\f\v";
    auto first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(kSpace);
    return text.substr(first, last - first + 1);
}

}  // namespace code_verdict
