#pragma once

#include "../core/constants.hpp"
#include "../core/record.hpp"
#include "../core/types.hpp"
#include "../geo/haversine.hpp"
#include <cmath>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace aistrack::track {

    // ─── Reporting cadence relative to the previous position ───────────────────
    enum class Continuity : u8 {
        FirstPosition,
        DataGap,
        HighFrequency,   // <= 30 min
        NormalFrequency, // <= 2 h
        LowFrequency,    // <= 6 h
        DailyReport,     // <= 24 h
        LargeGap,
    };

    // ─── Movement class from the derived speed ──────────────────────────────────
    enum class Movement : u8 {
        Initial,
        StationaryOrGap,
        Anchored,      // < 0.5 kn
        SlowMovement,  // < 5 kn
        NormalTransit, // < 15 kn
        FastTransit,   // < 25 kn
        HighSpeed,     // < 60 kn
        AnomalousSpeed,
    };

    inline const char *to_string(Continuity c) noexcept {
        switch (c) {
        case Continuity::FirstPosition:
            return "first_position";
        case Continuity::DataGap:
            return "data_gap";
        case Continuity::HighFrequency:
            return "high_frequency";
        case Continuity::NormalFrequency:
            return "normal_frequency";
        case Continuity::LowFrequency:
            return "low_frequency";
        case Continuity::DailyReport:
            return "daily_report";
        case Continuity::LargeGap:
            return "large_gap";
        }
        return "unknown";
    }

    inline const char *to_string(Movement m) noexcept {
        switch (m) {
        case Movement::Initial:
            return "initial";
        case Movement::StationaryOrGap:
            return "stationary_or_gap";
        case Movement::Anchored:
            return "anchored";
        case Movement::SlowMovement:
            return "slow_movement";
        case Movement::NormalTransit:
            return "normal_transit";
        case Movement::FastTransit:
            return "fast_transit";
        case Movement::HighSpeed:
            return "high_speed";
        case Movement::AnomalousSpeed:
            return "anomalous_speed";
        }
        return "unknown";
    }

    inline constexpr f64 MIN_RETAINED_QUALITY = 0.3;
    inline constexpr f64 MAX_RETAINED_GAP_H = 72.0;
    inline constexpr f64 MAX_SPEED_WINDOW_H = 24.0;

    // ─── Per-position assessment ─────────────────────────────────────────────────
    struct PositionAssessment {
        CleanedPositionRecord record;
        usize position_sequence = 0; // 1-based
        OptF64 hours_since_prev;
        OptF64 distance_km_from_prev;
        OptF64 calculated_speed_knots;
        OptF64 course_change_deg;
        OptF64 speed_difference_knots;
        Continuity continuity = Continuity::FirstPosition;
        Movement movement = Movement::Initial;
        f64 quality_score = 0.0;
        f64 cumulative_distance_km = 0.0;
        f64 running_quality_score = 0.0;
        bool potential_anomaly = false;

        bool retained() const noexcept {
            return quality_score >= MIN_RETAINED_QUALITY &&
                   (!hours_since_prev.has_value() || *hours_since_prev <= MAX_RETAINED_GAP_H);
        }
    };

    namespace detail {

        inline Continuity classify_continuity(usize seq, const OptF64 &hours) noexcept {
            if (seq == 1)
                return Continuity::FirstPosition;
            if (!hours.has_value())
                return Continuity::DataGap;
            if (*hours <= 0.5)
                return Continuity::HighFrequency;
            if (*hours <= 2.0)
                return Continuity::NormalFrequency;
            if (*hours <= 6.0)
                return Continuity::LowFrequency;
            if (*hours <= 24.0)
                return Continuity::DailyReport;
            return Continuity::LargeGap;
        }

        inline Movement classify_movement(usize seq, const OptF64 &knots) noexcept {
            if (seq == 1)
                return Movement::Initial;
            if (!knots.has_value())
                return Movement::StationaryOrGap;
            if (*knots < 0.5)
                return Movement::Anchored;
            if (*knots < 5.0)
                return Movement::SlowMovement;
            if (*knots < 15.0)
                return Movement::NormalTransit;
            if (*knots < 25.0)
                return Movement::FastTransit;
            if (*knots < HIGH_SPEED_KNOTS)
                return Movement::HighSpeed;
            return Movement::AnomalousSpeed;
        }

        inline f64 quality_score(const PositionAssessment &a) noexcept {
            if (a.position_sequence == 1)
                return 0.8;
            if (!a.hours_since_prev.has_value())
                return 0.3;
            if (*a.hours_since_prev > 24.0)
                return 0.4;
            if (a.speed_difference_knots.has_value() && *a.speed_difference_knots > 20.0)
                return 0.5;
            if (*a.hours_since_prev <= 2.0 && a.distance_km_from_prev.has_value())
                return 1.0;
            if (*a.hours_since_prev <= 6.0)
                return 0.9;
            return 0.7;
        }

    } // namespace detail

    // ─── Track assessment ────────────────────────────────────────────────────────
    // `records` is one vessel's cleaned rows in ascending time order. Flagged
    // rows are left out; every remaining row gets an assessment. Use
    // PositionAssessment::retained() to apply the quality cut.
    inline dp::Vector<PositionAssessment> assess_track(const dp::Vector<CleanedPositionRecord> &records) {
        dp::Vector<PositionAssessment> out;
        out.reserve(records.size());

        f64 cumulative_km = 0.0;
        f64 quality_sum = 0.0;
        const CleanedPositionRecord *prev = nullptr;

        for (const auto &rec : records) {
            if (!rec.flags.empty())
                continue;

            PositionAssessment a;
            a.record = rec;
            a.position_sequence = out.size() + 1;

            if (prev) {
                const f64 hours = rec.timestamp.seconds_since(prev->timestamp) / SECONDS_PER_HOUR;
                a.hours_since_prev = hours;
                a.distance_km_from_prev = geo::haversine_km(prev->lat, prev->lon, rec.lat, rec.lon);

                if (hours > 0.0 && hours <= MAX_SPEED_WINDOW_H) {
                    a.calculated_speed_knots = (*a.distance_km_from_prev / hours) * KPH_TO_KNOTS;
                    if (rec.sog.has_value())
                        a.speed_difference_knots = std::fabs(*rec.sog - *a.calculated_speed_knots);
                }
                if (prev->cog.has_value() && rec.cog.has_value())
                    a.course_change_deg = geo::course_change_deg(*prev->cog, *rec.cog);
            }

            a.continuity = detail::classify_continuity(a.position_sequence, a.hours_since_prev);
            a.movement = detail::classify_movement(a.position_sequence, a.calculated_speed_knots);
            a.quality_score = detail::quality_score(a);

            cumulative_km += a.distance_km_from_prev.has_value() ? *a.distance_km_from_prev : 0.0;
            quality_sum += a.quality_score;
            a.cumulative_distance_km = cumulative_km;
            a.running_quality_score = quality_sum / static_cast<f64>(a.position_sequence);

            a.potential_anomaly =
                (a.calculated_speed_knots.has_value() && *a.calculated_speed_knots > HIGH_SPEED_KNOTS) ||
                (a.course_change_deg.has_value() && *a.course_change_deg > COG_JUMP_DEG &&
                 a.hours_since_prev.has_value() && *a.hours_since_prev <= 5.0 / 60.0) ||
                (a.speed_difference_knots.has_value() && *a.speed_difference_knots > 30.0);

            out.push_back(std::move(a));
            prev = &rec;
        }

        echo::category("aistrack.track.metrics").debug("assessed ", out.size(), " of ", records.size(), " records");
        return out;
    }

} // namespace aistrack::track
