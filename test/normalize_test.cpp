#include <doctest/doctest.h>
#include <aistrack/validate/normalize.hpp>

using namespace aistrack;
using namespace aistrack::validate;

namespace {

    CleanedPositionRecord base_record() {
        CleanedPositionRecord rec;
        rec.mmsi = "211000000";
        rec.timestamp = Timestamp::from_civil(2025, 1, 1, 8, 0, 0);
        rec.lat = 54.0;
        rec.lon = 7.0;
        rec.sog = 12.3;
        rec.cog = 45.0;
        rec.heading = 44.0;
        return rec;
    }

} // namespace

TEST_CASE("normalize_record motion ranges") {
    SUBCASE("in-range values kept") {
        auto n = normalize_record(base_record());
        CHECK(*n.sog == 12.3);
        CHECK(*n.cog == 45.0);
        CHECK(*n.heading == 44.0);
    }

    SUBCASE("speed outside [0, 200] becomes null") {
        auto rec = base_record();
        rec.sog = 102.3;
        CHECK(normalize_record(rec).sog.has_value());
        rec.sog = 204.6;
        CHECK_FALSE(normalize_record(rec).sog.has_value());
        rec.sog = -0.1;
        CHECK_FALSE(normalize_record(rec).sog.has_value());
    }

    SUBCASE("course must be below 360") {
        auto rec = base_record();
        rec.cog = 360.0;
        CHECK_FALSE(normalize_record(rec).cog.has_value());
        rec.cog = 359.9;
        CHECK(normalize_record(rec).cog.has_value());
        rec.cog = -1.0;
        CHECK_FALSE(normalize_record(rec).cog.has_value());
    }

    SUBCASE("heading sentinel and fractional values") {
        auto rec = base_record();
        rec.heading = static_cast<f64>(HEADING_NOT_AVAILABLE);
        CHECK_FALSE(normalize_record(rec).heading.has_value());
        rec.heading = 359.0;
        CHECK(normalize_record(rec).heading.has_value());
        rec.heading = 12.5;
        CHECK_FALSE(normalize_record(rec).heading.has_value());
    }
}

TEST_CASE("normalize_record text columns") {
    auto rec = base_record();
    rec.details.vessel_name = dp::String("  Ever Given ");
    rec.details.call_sign = dp::String(" h3rc ");
    rec.details.imo = dp::String("IMO9811000");
    rec.details.vessel_type = dp::String("70");
    rec.details.status = dp::String("16");
    rec.details.cargo = dp::String("0");
    rec.transceiver_class = dp::String(" A ");

    auto n = normalize_record(rec);
    REQUIRE(n.details.vessel_name.has_value());
    CHECK(*n.details.vessel_name == "ever given");
    REQUIRE(n.details.call_sign.has_value());
    CHECK(*n.details.call_sign == "H3RC");
    REQUIRE(n.details.imo.has_value());
    CHECK(*n.details.imo == "IMO9811000");
    REQUIRE(n.details.vessel_type.has_value());
    CHECK(*n.details.vessel_type == "70");
    CHECK_FALSE(n.details.status.has_value());
    CHECK_FALSE(n.details.cargo.has_value());
    REQUIRE(n.transceiver_class.has_value());
    CHECK(*n.transceiver_class == "A");

    SUBCASE("blank text becomes null") {
        rec.details.vessel_name = dp::String("   ");
        CHECK_FALSE(normalize_record(rec).details.vessel_name.has_value());
    }

    SUBCASE("malformed IMO numbers dropped") {
        rec.details.imo = dp::String("9811000");
        CHECK_FALSE(normalize_record(rec).details.imo.has_value());
        rec.details.imo = dp::String("IMO98110001");
        CHECK_FALSE(normalize_record(rec).details.imo.has_value());
        rec.details.imo = dp::String("IMO98110A0");
        CHECK_FALSE(normalize_record(rec).details.imo.has_value());
    }

    SUBCASE("float-formatted codes collapse to integers") {
        rec.details.vessel_type = dp::String("70.0");
        rec.details.cargo = dp::String("71.0");
        auto m = normalize_record(rec);
        CHECK(*m.details.vessel_type == "70");
        CHECK(*m.details.cargo == "71");
    }
}

TEST_CASE("normalize_batch keeps every row") {
    dp::Vector<CleanedPositionRecord> batch;
    for (int i = 0; i < 5; ++i) {
        auto rec = base_record();
        rec.sog = 100.0 * i;
        batch.push_back(rec);
    }
    auto out = normalize_batch(batch);
    REQUIRE(out.size() == 5);
    CHECK(out[2].sog.has_value());
    CHECK_FALSE(out[3].sog.has_value());
    CHECK(out[4].mmsi == "211000000");
}
