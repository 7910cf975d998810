#include <doctest/doctest.h>
#include "netbeacon/uuid.hpp"

#include <cctype>

using namespace netbeacon;

static constexpr uint64_t NOW = 1700000000000ULL;

TEST_CASE("Generated UUIDs are version 1 and carry their creation time") {
    Uuid u = Uuid::generate(NOW);
    CHECK(u.version() == 1);
    CHECK(u.timestamp_ms() == static_cast<int64_t>(NOW));
    CHECK((u.bytes[8] & 0xC0) == 0x80);          // RFC 4122 variant
    CHECK((u.bytes[10] & 0x01) == 0x01);         // random node, not a MAC
}

TEST_CASE("Text form is canonical lowercase and parses back") {
    Uuid u = Uuid::generate(NOW);
    const std::string s = u.to_string();
    REQUIRE(s.size() == 36);
    CHECK(s[8] == '-');
    CHECK(s[13] == '-');
    CHECK(s[18] == '-');
    CHECK(s[23] == '-');
    CHECK(s[14] == '1');
    for (char c : s) CHECK_FALSE(std::isupper(static_cast<unsigned char>(c)));

    Uuid back;
    REQUIRE(Uuid::parse(s, back));
    CHECK(back == u);

    int64_t ms = 0;
    REQUIRE(uuid_to_timestamp(s, ms));
    CHECK(ms == static_cast<int64_t>(NOW));
}

TEST_CASE("UUIDs minted in the same millisecond differ") {
    CHECK(Uuid::generate(NOW).to_string() != Uuid::generate(NOW).to_string());
}

TEST_CASE("A UUID minted at the Unix epoch decodes to zero") {
    // Sits exactly at the Gregorian offset.
    Uuid u = Uuid::generate(0);
    int64_t ms = -1;
    REQUIRE(uuid_to_timestamp(u.to_string(), ms));
    CHECK(ms == 0);
}

TEST_CASE("Parse rejects malformed text and non-time-based versions") {
    Uuid out;
    CHECK_FALSE(Uuid::parse("", out));
    CHECK_FALSE(Uuid::parse("not-a-uuid", out));
    CHECK_FALSE(Uuid::parse("123e4567-e89b-42d3-a456-426614174000", out));   // version 4
    CHECK_FALSE(Uuid::parse("123e4567+e89b-12d3-a456-426614174000", out));   // bad separator
    CHECK_FALSE(Uuid::parse("123e4567-e89b-12d3-a456-42661417400g", out));   // bad digit
    CHECK(Uuid::parse("123e4567-e89b-12d3-a456-426614174000", out));

    int64_t ms = 0;
    CHECK_FALSE(uuid_to_timestamp("123e4567-e89b-42d3-a456-426614174000", ms));
}
