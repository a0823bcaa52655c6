#include <doctest/doctest.h>
#include <aistrack/core/timestamp.hpp>

using namespace aistrack;

TEST_CASE("Timestamp parsing") {
    SUBCASE("AIS BaseDateTime form is UTC") {
        auto ts = Timestamp::parse("2025-01-01T00:00:00");
        REQUIRE(ts.is_ok());
        CHECK(ts.value().micros == 1735689600LL * 1000000);
    }

    SUBCASE("space separator accepted") {
        auto a = Timestamp::parse("2025-01-01 12:30:15");
        auto b = Timestamp::parse("2025-01-01T12:30:15");
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        CHECK(a.value() == b.value());
    }

    SUBCASE("Z suffix and explicit offsets") {
        auto z = Timestamp::parse("2025-06-30T10:00:00Z");
        auto plus = Timestamp::parse("2025-06-30T12:00:00+02:00");
        auto minus = Timestamp::parse("2025-06-30T05:30:00-04:30");
        REQUIRE(z.is_ok());
        REQUIRE(plus.is_ok());
        REQUIRE(minus.is_ok());
        CHECK(z.value() == plus.value());
        CHECK(z.value() == minus.value());
    }

    SUBCASE("fractional seconds") {
        auto ts = Timestamp::parse("2025-01-01T00:00:00.25");
        REQUIRE(ts.is_ok());
        CHECK(ts.value().micros % 1000000 == 250000);

        auto long_fraction = Timestamp::parse("2025-01-01T00:00:00.1234567");
        REQUIRE(long_fraction.is_ok());
        CHECK(long_fraction.value().micros % 1000000 == 123456);
    }

    SUBCASE("leap day") {
        CHECK(Timestamp::parse("2024-02-29T00:00:00").is_ok());
        CHECK_FALSE(Timestamp::parse("2023-02-29T00:00:00").is_ok());
    }

    SUBCASE("malformed text rejected") {
        CHECK_FALSE(Timestamp::parse("").is_ok());
        CHECK_FALSE(Timestamp::parse("2025-01-01").is_ok());
        CHECK_FALSE(Timestamp::parse("2025-13-01T00:00:00").is_ok());
        CHECK_FALSE(Timestamp::parse("2025-01-01T24:00:00").is_ok());
        CHECK_FALSE(Timestamp::parse("2025-01-01T00:00:00+0200").is_ok());
        CHECK_FALSE(Timestamp::parse("2025-01-01T00:00:00 junk").is_ok());
        CHECK_FALSE(Timestamp::parse("not a time").is_ok());
        auto r = Timestamp::parse("yesterday");
        CHECK(r.error().code == ErrorCode::ParseError);
    }
}

TEST_CASE("Timestamp normalized text") {
    CHECK(Timestamp::from_civil(2025, 1, 1).to_iso8601() == "2025-01-01T00:00:00+00:00");
    CHECK(Timestamp::from_civil(1999, 12, 31, 23, 59, 59, 500).to_iso8601() == "1999-12-31T23:59:59.000500+00:00");
    CHECK(Timestamp::from_seconds(-1).to_iso8601() == "1969-12-31T23:59:59+00:00");

    auto parsed = Timestamp::parse("2025-06-30T12:00:00+02:00");
    REQUIRE(parsed.is_ok());
    CHECK(parsed.value().to_iso8601() == "2025-06-30T10:00:00+00:00");
}

TEST_CASE("Timestamp arithmetic") {
    Timestamp t0 = Timestamp::from_civil(2025, 1, 1);
    Timestamp t1 = t0.plus_seconds(10);
    CHECK(t1.seconds_since(t0) == doctest::Approx(10.0));
    CHECK(t0.seconds_since(t1) == doctest::Approx(-10.0));
    CHECK(t0 < t1);
}
