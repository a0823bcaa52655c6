#include <doctest/doctest.h>
#include <aistrack/track/metrics.hpp>
#include <aistrack/track/vessel_track.hpp>
#include <cmath>

using namespace aistrack;
using namespace aistrack::track;

namespace {

    CleanedPositionRecord fix(i64 hours, f64 lat, f64 lon, f64 sog) {
        CleanedPositionRecord rec;
        rec.mmsi = "211000000";
        rec.timestamp = Timestamp::from_civil(2025, 1, 1).plus_seconds(hours * 3600);
        rec.lat = lat;
        rec.lon = lon;
        rec.sog = sog;
        return rec;
    }

} // namespace

TEST_CASE("assess_track") {
    auto flagged = fix(1, 0.0, 0.0, 0.0);
    flagged.flags.set(RecordFlag::ZeroPosition);
    dp::Vector<CleanedPositionRecord> records = {fix(0, 54.0, 7.0, 10.0), flagged, fix(2, 54.0, 7.45, 10.0),
                                                 fix(32, 54.0, 7.45, 0.0), fix(132, 54.0, 7.46, 0.0)};

    auto out = assess_track(records);
    REQUIRE(out.size() == 4);

    SUBCASE("first position") {
        CHECK(out[0].position_sequence == 1);
        CHECK(out[0].continuity == Continuity::FirstPosition);
        CHECK(out[0].movement == Movement::Initial);
        CHECK(out[0].quality_score == doctest::Approx(0.8));
        CHECK_FALSE(out[0].hours_since_prev.has_value());
        CHECK(out[0].retained());
    }

    SUBCASE("flagged rows are skipped, regular step scored") {
        const auto &a = out[1];
        CHECK(a.record.lon == 7.45);
        REQUIRE(a.hours_since_prev.has_value());
        CHECK(*a.hours_since_prev == doctest::Approx(2.0));
        CHECK(*a.distance_km_from_prev == doctest::Approx(29.41).epsilon(1e-3));
        REQUIRE(a.calculated_speed_knots.has_value());
        CHECK(*a.calculated_speed_knots == doctest::Approx(29.41 / 2.0 * KPH_TO_KNOTS).epsilon(1e-3));
        CHECK(a.continuity == Continuity::NormalFrequency);
        CHECK(a.movement == Movement::NormalTransit);
        CHECK(a.quality_score == doctest::Approx(1.0));
        CHECK_FALSE(a.potential_anomaly);
    }

    SUBCASE("long gap has no derived speed") {
        const auto &a = out[2];
        CHECK(a.continuity == Continuity::LargeGap);
        CHECK_FALSE(a.calculated_speed_knots.has_value());
        CHECK(a.movement == Movement::StationaryOrGap);
        CHECK(a.quality_score == doctest::Approx(0.4));
        CHECK(a.retained());
    }

    SUBCASE("gap over 72 hours is not retained") {
        CHECK(*out[3].hours_since_prev == doctest::Approx(100.0));
        CHECK_FALSE(out[3].retained());
    }

    SUBCASE("running totals") {
        CHECK(out[3].cumulative_distance_km ==
              doctest::Approx(*out[1].distance_km_from_prev + *out[2].distance_km_from_prev +
                              *out[3].distance_km_from_prev));
        CHECK(out[1].running_quality_score == doctest::Approx(0.9));
    }
}

TEST_CASE("classification labels") {
    CHECK(std::string(to_string(Continuity::DailyReport)) == "daily_report");
    CHECK(std::string(to_string(Movement::AnomalousSpeed)) == "anomalous_speed");
}

TEST_CASE("VesselTrack") {
    dp::Vector<CleanedPositionRecord> records = {fix(0, 54.0, 7.0, 10.0), fix(1, 54.1, 7.0, 10.0)};

    SUBCASE("built from one vessel's rows") {
        auto t = VesselTrack::from_records("211000000", records);
        REQUIRE(t.is_ok());
        CHECK(t.value().size() == 2);
        CHECK(t.value().is_time_ordered());
    }

    SUBCASE("foreign vessel rejected") {
        auto other = fix(2, 54.2, 7.0, 10.0);
        other.mmsi = "366000001";
        records.push_back(other);
        auto t = VesselTrack::from_records("211000000", records);
        CHECK_FALSE(t.is_ok());
        CHECK(t.error().code == ErrorCode::InvalidArgument);
    }

    SUBCASE("local ENU projection skips points without position") {
        auto t = VesselTrack::from_records("211000000", records);
        REQUIRE(t.is_ok());
        auto track = t.value();
        TrackPoint lost("211000000", Timestamp::from_civil(2025, 1, 1, 2, 0, 0), 54.2, 7.0);
        lost.lon = dp::nullopt;
        track.points.push_back(lost);
        track.points.push_back(TrackPoint::from(fix(3, 54.0, 7.1, 10.0)));

        dp::Geo ref{54.0, 7.0, 0.0};
        auto enu = track.to_enu_batch(ref);
        REQUIRE(enu.size() == 3);
        CHECK(std::abs(enu[0].east()) < 0.01);
        CHECK(std::abs(enu[0].north()) < 0.01);
        // 0.1 deg of latitude is ~11.1 km north
        CHECK(enu[1].north() == doctest::Approx(11119.5).epsilon(0.01));
        CHECK(std::abs(enu[1].east()) < 1.0);
        // 0.1 deg of longitude at 54N is ~6.5 km east
        CHECK(enu[2].east() == doctest::Approx(6535.7).epsilon(0.01));
    }

    SUBCASE("position accessors") {
        TrackPoint p("211000000", Timestamp::from_civil(2025, 1, 1), 54.0, 7.0);
        REQUIRE(p.wgs().has_value());
        CHECK(p.wgs()->latitude == 54.0);
        p.lat = dp::nullopt;
        CHECK_FALSE(p.wgs().has_value());

        auto a = records[0].wgs();
        auto b = records[1].wgs();
        CHECK(a.longitude == 7.0);
        CHECK(geo::haversine_km(a, b) == doctest::Approx(11.1195).epsilon(1e-4));
    }

    SUBCASE("order check") {
        VesselTrack t;
        t.mmsi = "211000000";
        t.points.push_back(TrackPoint::from(records[1]));
        t.points.push_back(TrackPoint::from(records[0]));
        CHECK_FALSE(t.is_time_ordered());
    }
}
