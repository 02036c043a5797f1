#pragma once

#include "config.hpp"
#include "logging.hpp"

#include <cassert>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sanitation {

/** Half-open offset range [begin, end) into a classified buffer. */
struct byte_span {
    std::size_t begin;
    std::size_t end;

    auto size() const -> std::size_t {
        return end - begin;
    }
};

inline auto operator==(const byte_span& a, const byte_span& b) -> bool {
    return a.begin == b.begin && a.end == b.end;
}

inline auto operator!=(const byte_span& a, const byte_span& b) -> bool {
    return !(a == b);
}

/**
 * Result of a classification. Every input byte lands in exactly one of safe or garbage, each kept in input order.
 * garbage_spans holds one span per maximal contiguous run of garbage, ascending.
 */
struct partition {
    byte_vector safe;
    byte_vector garbage;
    std::vector<byte_span> garbage_spans;
};

inline constexpr auto is_continuation(byte b) -> bool {
    return (b & config::continuation_mask) == config::continuation_pattern;
}

/** Length of the sequence that lead starts, or 0 if lead cannot start one (C0, C1, F5-FF and continuation bytes). */
inline constexpr auto sequence_length(byte lead) -> std::size_t {
    if (lead <= config::ascii_max) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return 2;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        return 4;
    }
    return 0;
}

namespace _detail {

// RFC 3629 narrows the second byte after these leads to rule out overlongs, surrogates and code points past U+10FFFF.
inline constexpr auto second_byte_range(byte lead) -> std::pair<byte, byte> {
    switch (lead) {
        case 0xE0: return {0xA0, 0xBF};
        case 0xED: return {0x80, 0x9F};
        case 0xF0: return {0x90, 0xBF};
        case 0xF4: return {0x80, 0x8F};
        default: return {config::continuation_min, config::continuation_max};
    }
}

} // namespace _detail

/** Length of the well-formed UTF-8 unit starting at b, or 0 if there is none. Never reads at or past e. */
inline auto match_sequence(const byte* b, const byte* e) -> std::size_t {
    assert(b < e);

    auto len = sequence_length(*b);

    if (len == 0 || std::size_t(e - b) < len) {
        return 0;
    }

    assert(len <= config::max_sequence_length);

    if (len > 1) {
        auto [lo, hi] = _detail::second_byte_range(*b);

        if (b[1] < lo || b[1] > hi) {
            return 0;
        }

        for (auto i = std::size_t(2); i < len; ++i) {
            if (!is_continuation(b[i])) {
                return 0;
            }
        }
    }

    return len;
}

/**
 * Splits [b, e) into safe and garbage in a single left-to-right pass.
 *
 * A well-formed unit is moved to safe as a whole. Anything else costs exactly one byte: the offending byte goes to
 * garbage and scanning resumes right after it, so bytes that failed to continue a sequence are examined again on
 * their own. Truncated sequences at the end of the buffer are handled the same way.
 */
inline auto classify(const byte* b, const byte* e) -> partition {
    assert(b <= e);

    auto result = partition{};
    result.safe.reserve(e - b);

    for (auto iter = b; iter != e;) {
        auto len = match_sequence(iter, e);

        if (len != 0) {
            result.safe.insert(result.safe.end(), iter, iter + len);
            iter += len;
            continue;
        }

        auto offset = std::size_t(iter - b);

        SANITATION_LOG_REJECT(offset, *iter);

        result.garbage.push_back(*iter);

        if (!result.garbage_spans.empty() && result.garbage_spans.back().end == offset) {
            ++result.garbage_spans.back().end;
        } else {
            result.garbage_spans.push_back({offset, offset + 1});
        }

        ++iter;
    }

    assert(result.safe.size() + result.garbage.size() == std::size_t(e - b));

    SANITATION_LOG_PARTITION("classify", result.safe.size(), result.garbage.size());

    return result;
}

inline auto classify(const byte_vector& bytes) -> partition {
    return classify(bytes.data(), bytes.data() + bytes.size());
}

inline auto classify(std::string_view str) -> partition {
    auto b = reinterpret_cast<const byte*>(str.data());
    return classify(b, b + str.size());
}

/**
 * Decodes UTF-8 into code points. Meant for partition::safe, which is always well-formed; a byte that does not start
 * a valid unit decodes to U+FFFD and consumes only itself.
 */
inline auto decode(const byte_vector& bytes) -> std::u32string {
    auto out = std::u32string();
    out.reserve(bytes.size());

    auto b = bytes.data();
    auto e = bytes.data() + bytes.size();

    for (auto iter = b; iter != e;) {
        auto len = match_sequence(iter, e);

        switch (len) {
            case 1:
                out.push_back(char32_t(iter[0]));
                break;
            case 2:
                out.push_back(char32_t(iter[0] & 0x1F) << 6 | char32_t(iter[1] & 0x3F));
                break;
            case 3:
                out.push_back(char32_t(iter[0] & 0x0F) << 12 | char32_t(iter[1] & 0x3F) << 6 | char32_t(iter[2] & 0x3F));
                break;
            case 4:
                out.push_back(char32_t(iter[0] & 0x07) << 18 | char32_t(iter[1] & 0x3F) << 12 | char32_t(iter[2] & 0x3F) << 6 | char32_t(iter[3] & 0x3F));
                break;
            default:
                out.push_back(config::replacement_character);
                len = 1;
                break;
        }

        iter += len;
    }

    return out;
}

} // namespace sanitation
