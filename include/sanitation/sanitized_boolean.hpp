#pragma once

#include "config.hpp"
#include "hex.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace sanitation {

/**
 * An RFC 4251 boolean: one byte, 0 is false and 1 is true.
 * Any other value still reads as true, but the byte is also kept as garbage since a conforming peer never sends it.
 */
class sanitized_boolean final {
public:
    sanitized_boolean() :
        raw_value(0) {}

    explicit sanitized_boolean(byte value) :
        raw_value(value) {}

    auto value() const -> bool {
        return raw_value != 0;
    }

    auto garbage() const -> std::optional<byte> {
        if (raw_value == 0 || raw_value == 1) {
            return std::nullopt;
        }
        return raw_value;
    }

    auto has_garbage() const -> bool {
        return garbage().has_value();
    }

    auto raw() const -> byte {
        return raw_value;
    }

private:
    byte raw_value;
};

inline auto operator==(const sanitized_boolean& a, const sanitized_boolean& b) -> bool {
    return a.raw() == b.raw();
}

inline auto operator!=(const sanitized_boolean& a, const sanitized_boolean& b) -> bool {
    return !(a == b);
}

inline auto operator<<(std::ostream& os, const sanitized_boolean& b) -> std::ostream& {
    return os << (b.value() ? "true" : "false");
}

/** Debug form, e.g. "sanitized-boolean: true\r\ngarbage: 0xf4". */
inline auto describe(const sanitized_boolean& b) -> std::string {
    auto out = std::string("sanitized-boolean: ") + (b.value() ? "true" : "false");
    if (auto g = b.garbage()) {
        out += "\r\ngarbage: " + to_hex_literal(byte_vector{*g});
    }
    return out;
}

} // namespace sanitation
