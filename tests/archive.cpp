#include <catch2/catch.hpp>

#include <sanitation/archive.hpp>

#include <cereal/archives/binary.hpp>

#include <sstream>

using sanitation::byte_vector;
using sanitation::sanitized_boolean;
using sanitation::sanitized_buffer;

TEST_CASE("A loaded buffer carries the same partition", "[archive]") {
    auto original = sanitized_buffer(byte_vector{0x47, 0x45, 0x54, 0x20, 0x90, 0x90, 0xEB, 0xFE, 0xC3, 0xA9});
    auto stream = std::stringstream();

    {
        auto archive = cereal::BinaryOutputArchive(stream);
        archive(original);
    }

    auto loaded = sanitized_buffer();

    {
        auto archive = cereal::BinaryInputArchive(stream);
        archive(loaded);
    }

    REQUIRE(loaded == original);
    REQUIRE(loaded.garbage_bytes() == original.garbage_bytes());
    REQUIRE(loaded.garbage_hex() == "9090ebfe");
    REQUIRE(loaded.strict_text() == "GET \xC3\xA9");
}

TEST_CASE("Capture records hold buffers and booleans in order", "[archive]") {
    auto stream = std::stringstream();

    {
        auto archive = cereal::BinaryOutputArchive(stream);
        archive(sanitized_boolean(0x03), sanitized_buffer(std::string_view("ok")), sanitized_buffer(byte_vector{0xFF}));
    }

    auto flag = sanitized_boolean();
    auto first = sanitized_buffer();
    auto second = sanitized_buffer();

    {
        auto archive = cereal::BinaryInputArchive(stream);
        archive(flag, first, second);
    }

    REQUIRE(flag.garbage() == sanitation::byte(0x03));
    REQUIRE(first.checked_text() == "ok");
    REQUIRE(second.garbage_bytes() == byte_vector{0xFF});
}
