#include <catch2/catch_all.hpp>
#include <od/timestamp.h>

using namespace od;

TEST_CASE("parse RFC 3339 timestamps", "[timestamp]") {
    auto utc = parse_rfc3339("2023-04-05T06:07:08Z");
    REQUIRE(utc);
    REQUIRE(utc->seconds == 1680674828);
    REQUIRE(utc->nanos == 0);
    REQUIRE(utc->offset_minutes == 0);

    auto west = parse_rfc3339("2023-04-05T01:07:08.000001-05:00");
    REQUIRE(west);
    REQUIRE(west->seconds == 1680674828);
    REQUIRE(west->nanos == 1000);
    REQUIRE(west->offset_minutes == -300);

    auto epoch = parse_rfc3339("1970-01-01T00:00:00Z");
    REQUIRE(epoch);
    REQUIRE(epoch->seconds == 0);

    auto before = parse_rfc3339("1969-12-31T23:59:59Z");
    REQUIRE(before);
    REQUIRE(before->seconds == -1);
}

TEST_CASE("malformed timestamps are rejected", "[timestamp]") {
    REQUIRE(!parse_rfc3339(""));
    REQUIRE(!parse_rfc3339("2023-04-05"));
    REQUIRE(!parse_rfc3339("2023-04-05 06:07:08Z"));
    REQUIRE(!parse_rfc3339("2023-04-05T06:07:08"));
    REQUIRE(!parse_rfc3339("2023-04-05T06:07:08+0200"));
    REQUIRE(!parse_rfc3339("2023-04-05T06:07:08Zjunk"));
    REQUIRE(!parse_rfc3339("2023-04-05T24:00:00Z"));
    REQUIRE(!parse_rfc3339("2023-04-31T00:00:00Z"));
    REQUIRE(!parse_rfc3339("2023-02-29T00:00:00Z"));
    REQUIRE(!parse_rfc3339("1900-02-29T00:00:00Z"));
    REQUIRE(!parse_rfc3339("2023-04-05T06:07:08.Z"));
    REQUIRE(parse_rfc3339("2024-02-29T00:00:00Z"));
    REQUIRE(parse_rfc3339("2000-02-29T00:00:00Z"));
}

TEST_CASE("format uses the stored offset", "[timestamp]") {
    REQUIRE(format_rfc3339(Timestamp{}) == "1970-01-01T00:00:00Z");
    REQUIRE(format_rfc3339(Timestamp{1680674828, 500000000, 120}) == "2023-04-05T08:07:08.5+02:00");
    REQUIRE(format_rfc3339(Timestamp{1680674828, 1000, -330}) == "2023-04-05T00:37:08.000001-05:30");
    REQUIRE(format_rfc3339(Timestamp{-1, 0, 0}) == "1969-12-31T23:59:59Z");
}

TEST_CASE("parse and format agree", "[timestamp]") {
    for (const char* s : {"2023-04-05T06:07:08Z", "1999-12-31T23:59:59.999999999+14:00", "0001-01-01T00:00:00Z",
                          "9999-12-31T23:59:59-12:00"}) {
        auto ts = parse_rfc3339(s);
        REQUIRE(ts);
        REQUIRE(format_rfc3339(*ts) == s);
    }
}

TEST_CASE("year follows the wall clock", "[timestamp]") {
    REQUIRE(Timestamp{}.year() == 1970);
    REQUIRE(Timestamp{-1, 0, 0}.year() == 1969);
    REQUIRE(Timestamp{253402297200, 0, 0}.year() == 9999);
    REQUIRE(Timestamp{253402297200, 0, 60}.year() == 10000);
}

TEST_CASE("fractions beyond nanoseconds are truncated", "[timestamp]") {
    auto ts = parse_rfc3339("2023-04-05T06:07:08.1234567899876Z");
    REQUIRE(ts);
    REQUIRE(ts->seconds == 1680674828);
    REQUIRE(ts->nanos == 123456789);
    REQUIRE(format_rfc3339(*ts) == "2023-04-05T06:07:08.123456789Z");
}
