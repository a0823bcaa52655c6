#include <aistrack.hpp>
#include <echo/echo.hpp>
#include <cmath>
#include <iostream>

using namespace aistrack;

int main() {
    echo::info("=== Track sanitization demo ===");

    // A vessel steaming east at ~12 kn, one report per minute, with a few
    // receiver glitches mixed in
    const Mmsi mmsi = "211000000";
    const Timestamp t0 = Timestamp::from_civil(2025, 1, 1, 8, 0, 0);
    constexpr i32 NUM_POINTS = 240;
    constexpr f64 STEP_DEG = 0.0037; // ~370 m per minute near 54N

    dp::Vector<TrackPoint> points;
    for (i32 i = 0; i < NUM_POINTS; ++i) {
        TrackPoint p(mmsi, t0.plus_seconds(i * 60), 54.0 + 0.01 * std::sin(i * 0.05), 7.0 + i * STEP_DEG);
        p.sog = 12.0;
        p.cog = 90.0;
        if (i % 50 == 25) {
            p.lat = 1.0; // spurious fix far away
            p.lon = 2.0;
        }
        points.push_back(p);
    }
    echo::info("Generated ", points.size(), " positions");

    auto cleaned = track::sanitize(points, track::SanitizeOptions{}.max_speed(200.0).points(60));
    if (!cleaned.is_ok()) {
        echo::error("sanitize failed: ", cleaned.error().message);
        return 1;
    }
    echo::info("Sanitized to ", cleaned.value().size(), " positions");

    auto fc = encode::encode(cleaned.value());
    echo::info("First: ", fc.features.front().properties.timestamp->c_str());
    echo::info("Last:  ", fc.features.back().properties.timestamp->c_str());

    auto view = encode::build_map_view(fc);
    if (auto layer = encode::attach_timestamped_layer(view, fc, "PT1M"); !layer.is_ok())
        echo::warn("no animation layer: ", layer.error().message);
    echo::info("Map center: ", view.center.lat, ", ", view.center.lon, " zoom=", static_cast<int>(view.zoom));

    std::cout << fc.dump(2) << std::endl;
    return 0;
}
