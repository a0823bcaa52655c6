#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/record.hpp"
#include "../core/types.hpp"
#include "../geo/haversine.hpp"
#include <cmath>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace aistrack::track {

    // ─── Sanitizer parameters ────────────────────────────────────────────────────
    struct SanitizeOptions {
        f64 max_speed_kph = DEFAULT_MAX_SPEED_KPH;
        usize max_points = DEFAULT_MAX_POINTS;

        SanitizeOptions &max_speed(f64 kph) {
            max_speed_kph = kph;
            return *this;
        }
        SanitizeOptions &points(usize n) {
            max_points = n;
            return *this;
        }
    };

    inline Result<void> check_options(const SanitizeOptions &opts) {
        if (!(opts.max_speed_kph > 0.0) || !std::isfinite(opts.max_speed_kph)) {
            return Result<void>::err(Error::invalid_argument("max_speed_kph must be a positive finite number, got " +
                                                             dp::String(std::to_string(opts.max_speed_kph))));
        }
        if (opts.max_points == 0) {
            return Result<void>::err(Error::invalid_argument("max_points must be at least 1"));
        }
        return {};
    }

    // ─── Phase 1: implausible-motion filter ─────────────────────────────────────
    // Single forward pass with one anchor (the last accepted point). A candidate
    // is discarded when it lacks position or time, when it is not strictly later
    // than the anchor, or when reaching it from the anchor needs more than
    // `max_speed_kph`. A discarded candidate never moves the anchor, so one bad
    // fix does not poison the points after it.
    inline dp::Vector<TrackPoint> filter_implausible_motion(const dp::Vector<TrackPoint> &track, f64 max_speed_kph) {
        dp::Vector<TrackPoint> kept;
        kept.reserve(track.size());

        const TrackPoint *anchor = nullptr;
        usize incomplete = 0, temporal = 0, implausible = 0;

        for (const auto &candidate : track) {
            if (!candidate.is_complete()) {
                ++incomplete;
                continue;
            }
            if (anchor == nullptr) {
                kept.push_back(candidate);
                anchor = &candidate;
                continue;
            }

            const f64 dt = candidate.timestamp->seconds_since(*anchor->timestamp);
            if (dt <= 0.0) {
                ++temporal;
                continue;
            }

            const f64 dist = geo::haversine_km(*anchor->lat, *anchor->lon, *candidate.lat, *candidate.lon);
            const f64 kph = geo::speed_kph(dist, dt);
            if (kph > max_speed_kph) {
                ++implausible;
                echo::category("aistrack.track.sanitize")
                    .trace("implausible motion: ", kph, " km/h over ", dt, " s at ",
                           candidate.timestamp->to_iso8601());
                continue;
            }

            kept.push_back(candidate);
            anchor = &candidate;
        }

        echo::category("aistrack.track.sanitize")
            .debug("motion filter: in=", track.size(), " kept=", kept.size(), " incomplete=", incomplete,
                   " temporal=", temporal, " implausible=", implausible);
        return kept;
    }

    // ─── Phase 2: density reduction ─────────────────────────────────────────────
    // n <= max_points: unchanged. Otherwise exactly max_points elements at
    // indices floor(i * (n-1) / (max_points-1)), which always include the first
    // and the last input. With max_points == 1 only the first point is kept.
    template <typename T> dp::Vector<T> downsample(const dp::Vector<T> &points, usize max_points) {
        const usize n = points.size();
        if (n <= max_points)
            return points;

        dp::Vector<T> out;
        if (max_points == 0)
            return out;
        out.reserve(max_points);
        if (max_points == 1) {
            out.push_back(points.front());
            return out;
        }

        const u64 span = static_cast<u64>(n - 1);
        const u64 slots = static_cast<u64>(max_points - 1);
        for (u64 i = 0; i < static_cast<u64>(max_points); ++i) {
            out.push_back(points[static_cast<usize>((i * span) / slots)]);
        }
        return out;
    }

    // ─── Full sanitization ───────────────────────────────────────────────────────
    // `track` is expected in ascending time order; this is not checked here.
    // The input is never modified.
    inline Result<dp::Vector<TrackPoint>> sanitize(const dp::Vector<TrackPoint> &track,
                                                   const SanitizeOptions &opts = {}) {
        auto valid = check_options(opts);
        if (!valid.is_ok()) {
            echo::category("aistrack.track.sanitize").warn("rejected call: ", valid.error().message);
            return Result<dp::Vector<TrackPoint>>::err(valid.error());
        }

        auto filtered = filter_implausible_motion(track, opts.max_speed_kph);
        auto sampled = downsample(filtered, opts.max_points);
        echo::category("aistrack.track.sanitize")
            .debug("sanitized track: in=", track.size(), " out=", sampled.size());
        return Result<dp::Vector<TrackPoint>>::ok(std::move(sampled));
    }

    inline Result<dp::Vector<TrackPoint>> sanitize(const dp::Vector<CleanedPositionRecord> &track,
                                                   const SanitizeOptions &opts = {}) {
        return sanitize(to_track_points(track), opts);
    }

} // namespace aistrack::track
