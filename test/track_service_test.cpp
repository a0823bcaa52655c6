#include <doctest/doctest.h>
#include <aistrack/service/track_service.hpp>
#include <limits>

using namespace aistrack;
using namespace aistrack::service;

namespace {

    // In-memory stand-in for the position store
    class FakeSource : public PositionSource {
      public:
        dp::Vector<TrackPoint> rows;
        dp::Vector<TrackQuery> queries;
        bool fail = false;

        Result<dp::Vector<TrackPoint>> fetch(const TrackQuery &query) override {
            queries.push_back(query);
            if (fail)
                return Result<dp::Vector<TrackPoint>>::err(Error(ErrorCode::SourceError, "connection refused"));
            dp::Vector<TrackPoint> out;
            for (const auto &p : rows) {
                if (p.mmsi != query.mmsi)
                    continue;
                if (query.start.has_value() && p.timestamp.has_value() && *p.timestamp < *query.start)
                    continue;
                if (query.end.has_value() && p.timestamp.has_value() && *query.end < *p.timestamp)
                    continue;
                if (out.size() >= query.limit)
                    break;
                out.push_back(p);
            }
            return Result<dp::Vector<TrackPoint>>::ok(std::move(out));
        }
    };

    const Timestamp T0 = Timestamp::from_civil(2025, 1, 1);

    TrackPoint at(i64 seconds, f64 lat, f64 lon) { return TrackPoint("211000000", T0.plus_seconds(seconds), lat, lon); }

} // namespace

TEST_CASE("TrackService::clean_track") {
    FakeSource source;
    TrackService service(PipelineConfig{}, source);

    SUBCASE("spurious fix removed") {
        source.rows = {at(0, 1.0, 2.0), at(10, 1.5, 2.5)};
        auto t = service.clean_track("211000000");
        REQUIRE(t.is_ok());
        CHECK(t.value().mmsi == "211000000");
        REQUIRE(t.value().size() == 1);
        CHECK(t.value().points[0] == source.rows[0]);
    }

    SUBCASE("fetch limit carries headroom") {
        source.rows = {at(0, 1.0, 2.0)};
        REQUIRE(service.clean_track("211000000", dp::nullopt, dp::nullopt, 100).is_ok());
        REQUIRE(source.queries.size() == 1);
        CHECK(source.queries[0].limit == 500);

        REQUIRE(service.clean_track("211000000").is_ok());
        CHECK(source.queries[1].limit == DEFAULT_MAX_POINTS * DEFAULT_FETCH_HEADROOM);
    }

    SUBCASE("time window forwarded") {
        for (int i = 0; i < 10; ++i)
            source.rows.push_back(at(i * 60, 1.0 + i * 0.001, 2.0));
        auto t = service.clean_track("211000000", T0.plus_seconds(120), T0.plus_seconds(300));
        REQUIRE(t.is_ok());
        CHECK(t.value().size() == 4);
    }

    SUBCASE("unknown vessel gives an empty track") {
        source.rows = {at(0, 1.0, 2.0)};
        auto t = service.clean_track("366000001");
        REQUIRE(t.is_ok());
        CHECK(t.value().empty());
    }

    SUBCASE("bad arguments never reach the source") {
        CHECK_FALSE(service.clean_track("12345").is_ok());
        CHECK_FALSE(service.clean_track("211000000", dp::nullopt, dp::nullopt, 10001).is_ok());
        CHECK_FALSE(service.clean_track("211000000", T0.plus_seconds(60), T0).is_ok());
        CHECK(source.queries.empty());
    }

    SUBCASE("unordered source rows are rejected") {
        source.rows = {at(60, 1.0, 2.0), at(0, 1.0, 2.0)};
        auto t = service.clean_track("211000000");
        REQUIRE_FALSE(t.is_ok());
        CHECK(t.error().code == ErrorCode::Unordered);
    }

    SUBCASE("source failure propagated") {
        source.fail = true;
        auto t = service.clean_track("211000000");
        REQUIRE_FALSE(t.is_ok());
        CHECK(t.error().code == ErrorCode::SourceError);
    }
}

TEST_CASE("TrackService configuration") {
    FakeSource source;
    source.rows = {at(0, 1.0, 2.0)};

    SUBCASE("invalid config rejected before fetching") {
        TrackService service(PipelineConfig{}.set_max_speed_kph(-1.0), source);
        auto t = service.clean_track("211000000");
        REQUIRE_FALSE(t.is_ok());
        CHECK(t.error().code == ErrorCode::InvalidConfig);
        CHECK(source.queries.empty());
    }

    SUBCASE("huge headroom saturates the fetch limit") {
        TrackService service(PipelineConfig{}.set_fetch_headroom(std::numeric_limits<usize>::max()), source);
        REQUIRE(service.clean_track("211000000").is_ok());
        REQUIRE(source.queries.size() == 1);
        CHECK(source.queries[0].limit == std::numeric_limits<usize>::max());
    }

    SUBCASE("fetch_limit") {
        CHECK(fetch_limit(2000, 5) == 10000);
        CHECK(fetch_limit(0, 5) == 0);
        CHECK(fetch_limit(std::numeric_limits<usize>::max() / 2 + 1, 2) == std::numeric_limits<usize>::max());
    }
}

TEST_CASE("TrackService::positions and map") {
    FakeSource source;
    TrackService service(PipelineConfig{}.set_period("PT5S"), source);
    source.rows = {at(0, 54.0, 7.0), at(600, 54.01, 7.0), at(1200, 54.02, 7.0)};

    SUBCASE("GeoJSON collection") {
        auto fc = service.positions("211000000");
        REQUIRE(fc.is_ok());
        CHECK(fc.value().size() == 3);
        CHECK(fc.value().to_json()["features"][2]["geometry"]["coordinates"][1].get<double>() == 54.02);
    }

    SUBCASE("map with animation") {
        auto view = service.map("211000000");
        REQUIRE(view.is_ok());
        CHECK(view.value().zoom == encode::TRACK_MAP_ZOOM);
        REQUIRE(view.value().has_timestamped_layer());
        CHECK((*view.value().timestamped_layer)["period"] == "PT5S");
    }

    SUBCASE("empty track still yields a map") {
        auto view = service.map("366000001");
        REQUIRE(view.is_ok());
        CHECK(view.value().zoom == encode::EMPTY_MAP_ZOOM);
        CHECK_FALSE(view.value().has_timestamped_layer());
    }

    SUBCASE("errors propagate") {
        CHECK_FALSE(service.positions("bad").is_ok());
        CHECK_FALSE(service.map("bad").is_ok());
    }
}
