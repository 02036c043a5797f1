#pragma once

#include "sanitized_boolean.hpp"
#include "sanitized_buffer.hpp"

#include <cereal/cereal.hpp>
#include <cereal/types/vector.hpp>

#include <utility>

namespace sanitation {

// Only the raw bytes are stored; loading reclassifies them.

template <typename Archive>
void save(Archive& archive, const sanitized_buffer& buf) {
    archive(cereal::make_nvp("raw", buf.raw_bytes()));
}

template <typename Archive>
void load(Archive& archive, sanitized_buffer& buf) {
    auto bytes = byte_vector();
    archive(cereal::make_nvp("raw", bytes));
    buf = sanitized_buffer(std::move(bytes));
}

template <typename Archive>
void save(Archive& archive, const sanitized_boolean& b) {
    auto value = b.raw();
    archive(cereal::make_nvp("raw", value));
}

template <typename Archive>
void load(Archive& archive, sanitized_boolean& b) {
    auto value = byte();
    archive(cereal::make_nvp("raw", value));
    b = sanitized_boolean(value);
}

} // namespace sanitation
