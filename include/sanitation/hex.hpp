#pragma once

#include "config.hpp"
#include "errors.hpp"

#include <cassert>
#include <string>
#include <string_view>

namespace sanitation {

namespace _detail {

inline constexpr char hex_digits[] = "0123456789abcdef";

inline constexpr auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace _detail

/** Lowercase hex, two digits per byte, no prefix and no separators. */
inline auto to_hex(const byte* b, const byte* e) -> std::string {
    assert(b <= e);

    auto out = std::string();
    out.reserve(2 * (e - b));

    for (auto iter = b; iter != e; ++iter) {
        out.push_back(_detail::hex_digits[*iter >> 4]);
        out.push_back(_detail::hex_digits[*iter & 0x0F]);
    }

    assert(out.size() == 2 * std::size_t(e - b));

    return out;
}

inline auto to_hex(const byte_vector& bytes) -> std::string {
    return to_hex(bytes.data(), bytes.data() + bytes.size());
}

/** Same as to_hex, with a leading "0x". Used for display in messages and logs. */
inline auto to_hex_literal(const byte_vector& bytes) -> std::string {
    return "0x" + to_hex(bytes);
}

/**
 * Parses hexadecimal text back into bytes.
 * Accepts an optional "0x" or "x" prefix and digits of either case. Odd-length input is read as if it had a leading zero.
 * Throws parse_error on empty input or on any character that is not a hex digit.
 */
inline auto from_hex(std::string_view hex) -> byte_vector {
    if (hex.empty()) {
        throw parse_error("empty hexadecimal string");
    }

    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    } else if (hex[0] == 'x' || hex[0] == 'X') {
        hex.remove_prefix(1);
    }

    for (auto i = std::size_t(0); i < hex.size(); ++i) {
        if (_detail::hex_value(hex[i]) < 0) {
            throw parse_error("invalid hexadecimal character at pos " + std::to_string(i + 1) + ": " + hex[i]);
        }
    }

    auto bytes = byte_vector();
    bytes.reserve((hex.size() + 1) / 2);

    auto i = std::size_t(0);

    if (hex.size() % 2 != 0) {
        bytes.push_back(byte(_detail::hex_value(hex[0])));
        i = 1;
    }

    for (; i < hex.size(); i += 2) {
        bytes.push_back(byte((_detail::hex_value(hex[i]) << 4) | _detail::hex_value(hex[i + 1])));
    }

    return bytes;
}

} // namespace sanitation
