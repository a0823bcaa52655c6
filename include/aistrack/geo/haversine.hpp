#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include <cmath>
#include <concord/concord.hpp>

namespace aistrack::geo {

    inline constexpr f64 deg_to_rad(f64 deg) noexcept { return deg * M_PI / 180.0; }

    // ─── Great-circle distance on a sphere of radius EARTH_RADIUS_KM ───────────
    //   a = sin²(Δφ/2) + cos φ1 · cos φ2 · sin²(Δλ/2)
    //   d = 2R · atan2(√a, √(1−a))
    inline f64 haversine_km(f64 lat1, f64 lon1, f64 lat2, f64 lon2) noexcept {
        const f64 phi1 = deg_to_rad(lat1);
        const f64 phi2 = deg_to_rad(lat2);
        const f64 dphi = phi2 - phi1;
        const f64 dlambda = deg_to_rad(lon2) - deg_to_rad(lon1);

        const f64 s1 = std::sin(dphi / 2.0);
        const f64 s2 = std::sin(dlambda / 2.0);
        const f64 a = s1 * s1 + std::cos(phi1) * std::cos(phi2) * s2 * s2;
        return 2.0 * EARTH_RADIUS_KM * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    }

    inline f64 haversine_km(const concord::earth::WGS &a, const concord::earth::WGS &b) noexcept {
        return haversine_km(a.latitude, a.longitude, b.latitude, b.longitude);
    }

    // Average speed needed to cover `distance_km` in `seconds`
    inline f64 speed_kph(f64 distance_km, f64 seconds) noexcept {
        return distance_km / (seconds / SECONDS_PER_HOUR);
    }

    // Smallest angle between two courses, in [0, 180]
    inline f64 course_change_deg(f64 from_deg, f64 to_deg) noexcept {
        const f64 diff = std::fabs(to_deg - from_deg);
        return std::fmin(diff, 360.0 - diff);
    }

} // namespace aistrack::geo
