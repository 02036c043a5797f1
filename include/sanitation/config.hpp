#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sanitation {

using byte = std::uint8_t;
using byte_vector = std::vector<byte>;

} // namespace sanitation

namespace sanitation::config {

inline constexpr byte ascii_max = 0x7F;

inline constexpr byte continuation_mask = 0xC0;
inline constexpr byte continuation_pattern = 0x80;
inline constexpr byte continuation_min = 0x80;
inline constexpr byte continuation_max = 0xBF;

inline constexpr std::size_t max_sequence_length = 4;

inline constexpr char32_t replacement_character = U'\uFFFD';

} // namespace sanitation::config
