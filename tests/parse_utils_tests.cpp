#include "test_common.hpp"

TEST_CASE("parse_int and parse_size_t enforce bounds") {
    bool ok = false;
    REQUIRE(parse_int("42", 0, 100, ok) == 42);
    REQUIRE(ok);
    REQUIRE(parse_int("-5", -10, 10, ok) == -5);
    REQUIRE(ok);
    parse_int("101", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_int("4x", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_int("", 0, 100, ok);
    REQUIRE_FALSE(ok);

    REQUIRE(parse_size_t("8", 1, 256, ok) == 8);
    REQUIRE(ok);
    parse_size_t("0", 1, 256, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("-1", 0, 256, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("99999999999999999999999", 0, 256, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bool accepts common spellings") {
    bool ok = false;
    for (const char* t : {"", "1", "true", "YES", "On"}) {
        REQUIRE(parse_bool(t, ok));
        REQUIRE(ok);
    }
    for (const char* f : {"0", "false", "No", "OFF"}) {
        REQUIRE_FALSE(parse_bool(f, ok));
        REQUIRE(ok);
    }
    parse_bool("maybe", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bytes understands units") {
    bool ok = false;
    REQUIRE(parse_bytes("512", ok) == 512);
    REQUIRE(ok);
    REQUIRE(parse_bytes("4K", ok) == 4096);
    REQUIRE(parse_bytes("10mb", ok) == 10u * 1024 * 1024);
    REQUIRE(parse_bytes("1G", ok) == 1024u * 1024 * 1024);
    REQUIRE(ok);
    parse_bytes("10x", ok);
    REQUIRE_FALSE(ok);
    parse_bytes("M", ok);
    REQUIRE_FALSE(ok);
    parse_bytes("99999999999T", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_duration understands units") {
    using namespace std::chrono;
    bool ok = false;
    REQUIRE(parse_duration("30", ok) == seconds(30));
    REQUIRE(parse_duration("2m", ok) == minutes(2));
    REQUIRE(parse_duration("3h", ok) == hours(3));
    REQUIRE(parse_duration("1d", ok) == hours(24));
    REQUIRE(parse_duration("1w", ok) == hours(24 * 7));
    REQUIRE(ok);
    parse_duration("5y", ok);
    REQUIRE_FALSE(ok);
    parse_duration("-5", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_time_ms understands units") {
    using namespace std::chrono;
    bool ok = false;
    REQUIRE(parse_time_ms("250", ok) == milliseconds(250));
    REQUIRE(parse_time_ms("250ms", ok) == milliseconds(250));
    REQUIRE(parse_time_ms("2s", ok) == milliseconds(2000));
    REQUIRE(parse_time_ms("1m", ok) == milliseconds(60000));
    REQUIRE(ok);
    parse_time_ms("1.5s", ok);
    REQUIRE_FALSE(ok);
}
