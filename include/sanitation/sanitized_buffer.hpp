#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "hex.hpp"
#include "logging.hpp"
#include "utf8_classifier.hpp"

#include <cassert>
#include <istream>
#include <iterator>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sanitation {

/**
 * Owns one untrusted byte buffer together with its safe/garbage partition.
 * The partition is computed once, in the constructor; every view afterwards is a read of it.
 */
class sanitized_buffer final {
public:
    sanitized_buffer() :
        raw(),
        parts() {}

    sanitized_buffer(const byte* b, const byte* e) :
        sanitized_buffer(byte_vector(b, e)) {}

    explicit sanitized_buffer(byte_vector bytes) :
        raw(std::move(bytes)),
        parts(classify(raw)) {
            SANITATION_LOG_BYTES("garbage", parts.garbage, parts.garbage.size());
        }

    explicit sanitized_buffer(std::string_view str) :
        sanitized_buffer(byte_vector(str.begin(), str.end())) {}

    /** Reads the stream until it stops yielding bytes, then classifies everything read. */
    static auto from_stream(std::istream& stream) -> sanitized_buffer {
        auto bytes = byte_vector(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
        return sanitized_buffer(std::move(bytes));
    }

    /**
     * Joins a range of chunks (byte vectors, strings, anything iterable over byte-sized values) and classifies the
     * result once, so a unit split across two chunks is still recognized.
     */
    template <typename Iter>
    static auto from_chunks(Iter b, Iter e) -> sanitized_buffer {
        auto bytes = byte_vector();
        for (auto iter = b; iter != e; ++iter) {
            bytes.insert(bytes.end(), std::begin(*iter), std::end(*iter));
        }
        return sanitized_buffer(std::move(bytes));
    }

    /** The safe bytes as a string. Always well-formed UTF-8. */
    auto strict_text() const -> std::string {
        return std::string(parts.safe.begin(), parts.safe.end());
    }

    auto strict_code_points() const -> std::u32string {
        return decode(parts.safe);
    }

    /**
     * Every non-garbage byte read as the code point of the same value, encoded as UTF-8.
     * A multi-byte unit shows up as one character per byte, e.g. C3 A9 renders as U+00C3 U+00A9 rather than U+00E9.
     */
    auto soft_text() const -> std::string {
        auto out = std::string();
        out.reserve(parts.safe.size() * 2);

        for (auto b : parts.safe) {
            if (b <= config::ascii_max) {
                out.push_back(char(b));
            } else {
                out.push_back(char(0xC0 | (b >> 6)));
                out.push_back(char(0x80 | (b & 0x3F)));
            }
        }

        return out;
    }

    auto soft_code_points() const -> std::u32string {
        return std::u32string(parts.safe.begin(), parts.safe.end());
    }

    auto garbage_bytes() const -> const byte_vector& {
        return parts.garbage;
    }

    auto garbage_hex() const -> std::string {
        return to_hex(parts.garbage);
    }

    auto garbage_spans() const -> const std::vector<byte_span>& {
        return parts.garbage_spans;
    }

    auto safe_bytes() const -> const byte_vector& {
        return parts.safe;
    }

    auto raw_bytes() const -> const byte_vector& {
        return raw;
    }

    auto size() const -> std::size_t {
        return raw.size();
    }

    auto safe_size() const -> std::size_t {
        return parts.safe.size();
    }

    auto garbage_size() const -> std::size_t {
        return parts.garbage.size();
    }

    auto empty() const -> bool {
        return raw.empty();
    }

    auto has_garbage() const -> bool {
        return !parts.garbage.empty();
    }

    /** The whole input as a string. Throws unsafe_string_error if any of it is garbage. */
    auto checked_text() const -> std::string {
        if (has_garbage()) {
            throw unsafe_string_error(
                "unsafe conversion of byte-sequence " + to_hex_literal(parts.safe) + " to string: contains garbage " + to_hex_literal(parts.garbage),
                parts.safe,
                parts.garbage);
        }

        assert(parts.safe == raw);

        return strict_text();
    }

private:
    byte_vector raw;
    partition parts;
};

inline auto operator==(const sanitized_buffer& a, const sanitized_buffer& b) -> bool {
    return a.raw_bytes() == b.raw_bytes();
}

inline auto operator!=(const sanitized_buffer& a, const sanitized_buffer& b) -> bool {
    return !(a == b);
}

inline auto operator<(const sanitized_buffer& a, const sanitized_buffer& b) -> bool {
    return a.raw_bytes() < b.raw_bytes();
}

inline auto operator<<(std::ostream& os, const sanitized_buffer& buf) -> std::ostream& {
    auto& safe = buf.safe_bytes();
    return os.write(reinterpret_cast<const char*>(safe.data()), std::streamsize(safe.size()));
}

} // namespace sanitation
