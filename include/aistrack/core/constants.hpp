#pragma once

#include "types.hpp"

namespace aistrack {

    // ─── Identity ────────────────────────────────────────────────────────────────
    inline constexpr usize MMSI_DIGITS = 9;

    // ─── Coordinate ranges (WGS84 degrees) ──────────────────────────────────────
    inline constexpr f64 LAT_MIN = -90.0;
    inline constexpr f64 LAT_MAX = 90.0;
    inline constexpr f64 LON_MIN = -180.0;
    inline constexpr f64 LON_MAX = 180.0;

    // ─── Geodesy ─────────────────────────────────────────────────────────────────
    inline constexpr f64 EARTH_RADIUS_KM = 6371.0; // mean radius, haversine sphere
    inline constexpr f64 KPH_TO_KNOTS = 0.539957;   // 1 kn = 1.852 km/h
    inline constexpr f64 SECONDS_PER_HOUR = 3600.0;
    inline constexpr i64 MICROS_PER_SECOND = 1'000'000;

    // ─── Pipeline defaults ───────────────────────────────────────────────────────
    inline constexpr f64 DEFAULT_MAX_SPEED_KPH = 200.0; // ~108 kn
    inline constexpr usize DEFAULT_MAX_POINTS = 2000;
    inline constexpr usize MAX_POINTS_LIMIT = 10000;
    inline constexpr usize DEFAULT_FETCH_HEADROOM = 5;
    inline constexpr usize DEFAULT_CSV_CHUNK_SIZE = 10000;

    // ─── AIS field ranges (staging normalization) ───────────────────────────────
    inline constexpr f64 SOG_MAX_KNOTS = 200.0;
    inline constexpr f64 COG_MAX_DEG = 360.0;      // exclusive
    inline constexpr f64 HEADING_MAX_DEG = 359.0;  // inclusive
    inline constexpr f64 HEADING_NOT_AVAILABLE = 511.0;
    inline constexpr f64 VESSEL_TYPE_MAX = 99.0;
    inline constexpr f64 NAV_STATUS_MAX = 15.0;

    // ─── Anomaly thresholds ──────────────────────────────────────────────────────
    inline constexpr f64 HIGH_SPEED_KNOTS = 60.0;
    inline constexpr f64 COG_JUMP_DEG = 90.0;
    inline constexpr i64 COG_JUMP_WINDOW_US = 5 * 60 * MICROS_PER_SECOND;

} // namespace aistrack
