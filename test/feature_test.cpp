#include <doctest/doctest.h>
#include <aistrack/encode/feature.hpp>

using namespace aistrack;
using namespace aistrack::encode;

TEST_CASE("encode track points") {
    const Timestamp t0 = Timestamp::from_civil(2025, 1, 1);

    SUBCASE("coordinates are longitude first") {
        TrackPoint p("211000000", t0, 54.5, 7.25);
        p.sog = 12.5;
        p.cog = 90.0;
        p.heading = 91.0;
        auto fc = encode(dp::Vector<TrackPoint>{p});
        REQUIRE(fc.size() == 1);
        CHECK(fc.features[0].longitude == 7.25);
        CHECK(fc.features[0].latitude == 54.5);

        auto j = fc.to_json();
        CHECK(j["type"] == "FeatureCollection");
        const auto &f = j["features"][0];
        CHECK(f["type"] == "Feature");
        CHECK(f["geometry"]["type"] == "Point");
        CHECK(f["geometry"]["coordinates"][0].get<double>() == 7.25);
        CHECK(f["geometry"]["coordinates"][1].get<double>() == 54.5);
        CHECK(f["properties"]["timestamp"] == "2025-01-01T00:00:00+00:00");
        CHECK(f["properties"]["speed"].get<double>() == 12.5);
        CHECK(f["properties"]["course"].get<double>() == 90.0);
        CHECK(f["properties"]["heading"].get<double>() == 91.0);
    }

    SUBCASE("missing attributes are null, not omitted") {
        TrackPoint p("211000000", t0, 54.5, 7.25);
        auto j = encode(dp::Vector<TrackPoint>{p}).to_json();
        const auto &props = j["features"][0]["properties"];
        REQUIRE(props.contains("speed"));
        CHECK(props["speed"].is_null());
        CHECK(props["course"].is_null());
        CHECK(props["heading"].is_null());
    }

    SUBCASE("missing timestamp becomes a null property") {
        TrackPoint p;
        p.mmsi = "211000000";
        p.lat = 1.0;
        p.lon = 2.0;
        auto j = encode(dp::Vector<TrackPoint>{p}).to_json();
        CHECK(j["features"][0]["properties"]["timestamp"].is_null());
    }

    SUBCASE("points without position skipped, order kept") {
        TrackPoint a("211000000", t0, 1.0, 2.0);
        TrackPoint b("211000000", t0.plus_seconds(60), 1.1, 2.1);
        b.lon = dp::nullopt;
        TrackPoint c("211000000", t0.plus_seconds(120), 1.2, 2.2);
        auto fc = encode(dp::Vector<TrackPoint>{a, b, c});
        REQUIRE(fc.size() == 2);
        CHECK(fc.features[0].latitude == 1.0);
        CHECK(fc.features[1].latitude == 1.2);
    }

    SUBCASE("empty input") {
        auto fc = encode(dp::Vector<TrackPoint>{});
        CHECK(fc.empty());
        CHECK(fc.dump() == R"({"features":[],"type":"FeatureCollection"})");
    }

    SUBCASE("cleaned record overload") {
        CleanedPositionRecord rec;
        rec.mmsi = "211000000";
        rec.timestamp = t0;
        rec.lat = -33.9;
        rec.lon = 18.4;
        auto fc = encode(dp::Vector<CleanedPositionRecord>{rec});
        REQUIRE(fc.size() == 1);
        CHECK(fc.features[0].longitude == 18.4);
    }
}
