#pragma once

#include "config.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace sanitation {

/** Base of every exception thrown by sanitation. The classification views themselves never throw. */
class error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** Malformed hexadecimal text given to from_hex. */
class parse_error final : public error {
public:
    using error::error;
};

/**
 * Thrown by sanitized_buffer::checked_text when the buffer holds garbage.
 * Carries copies of both halves of the partition so the caller can inspect them after the buffer is gone.
 */
class unsafe_string_error final : public error {
public:
    unsafe_string_error(const std::string& what, byte_vector safe, byte_vector garbage) :
        error(what),
        safe_bytes(std::move(safe)),
        garbage_bytes(std::move(garbage)) {}

    auto safe() const -> const byte_vector& {
        return safe_bytes;
    }

    auto garbage() const -> const byte_vector& {
        return garbage_bytes;
    }

private:
    byte_vector safe_bytes;
    byte_vector garbage_bytes;
};

} // namespace sanitation
