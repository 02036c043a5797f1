#include <catch2/catch.hpp>

#include <sanitation/sanitized_boolean.hpp>

#include <sstream>

using sanitation::sanitized_boolean;

TEST_CASE("Zero is false without garbage", "[sanitized_boolean]") {
    auto b = sanitized_boolean(0x00);
    REQUIRE_FALSE(b.value());
    REQUIRE_FALSE(b.garbage().has_value());
    REQUIRE_FALSE(b.has_garbage());
}

TEST_CASE("One is true without garbage", "[sanitized_boolean]") {
    auto b = sanitized_boolean(0x01);
    REQUIRE(b.value());
    REQUIRE_FALSE(b.garbage().has_value());
}

TEST_CASE("Other values are true and kept as garbage", "[sanitized_boolean]") {
    auto two = sanitized_boolean(0x02);
    REQUIRE(two.value());
    REQUIRE(two.garbage() == sanitation::byte(0x02));

    auto f4 = sanitized_boolean(0xF4);
    REQUIRE(f4.value());
    REQUIRE(f4.garbage() == sanitation::byte(0xF4));
    REQUIRE(f4.raw() == 0xF4);
}

TEST_CASE("Boolean display and debug forms", "[sanitized_boolean]") {
    auto out = std::ostringstream();
    out << sanitized_boolean(0x00) << " " << sanitized_boolean(0x01) << " " << sanitized_boolean(0x7F);
    REQUIRE(out.str() == "false true true");

    REQUIRE(sanitation::describe(sanitized_boolean(0x01)) == "sanitized-boolean: true");
    REQUIRE(sanitation::describe(sanitized_boolean(0xF4)) == "sanitized-boolean: true\r\ngarbage: 0xf4");
}
