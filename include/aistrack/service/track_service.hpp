#pragma once

#include "../core/config.hpp"
#include "../core/error.hpp"
#include "../core/mmsi.hpp"
#include "../core/record.hpp"
#include "../core/types.hpp"
#include "../encode/feature.hpp"
#include "../encode/map_view.hpp"
#include "../track/sanitizer.hpp"
#include "../track/vessel_track.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <limits>
#include <string>
#include <utility>

namespace aistrack::service {

    // ─── Storage-side query ──────────────────────────────────────────────────────
    struct TrackQuery {
        Mmsi mmsi;
        dp::Optional<Timestamp> start; // inclusive
        dp::Optional<Timestamp> end;   // inclusive
        usize limit = 0;
    };

    // Supplies one vessel's stored positions in ascending time order, at most
    // `limit` rows. Implemented by the persistence layer.
    class PositionSource {
      public:
        virtual ~PositionSource() = default;
        virtual Result<dp::Vector<TrackPoint>> fetch(const TrackQuery &query) = 0;
    };

    // Rows requested from storage; saturates instead of wrapping
    inline usize fetch_limit(usize max_points, usize headroom) noexcept {
        if (headroom != 0 && max_points > std::numeric_limits<usize>::max() / headroom)
            return std::numeric_limits<usize>::max();
        return max_points * headroom;
    }

    // ─── Query-time trajectory service ──────────────────────────────────────────
    // fetch -> order check -> sanitize -> encode. Holds no state between calls.
    class TrackService {
        PipelineConfig config_;
        PositionSource &source_;

      public:
        TrackService(PipelineConfig config, PositionSource &source) : config_(std::move(config)), source_(source) {}

        const PipelineConfig &config() const noexcept { return config_; }

        Result<track::VesselTrack> clean_track(const Mmsi &mmsi, dp::Optional<Timestamp> start = dp::nullopt,
                                               dp::Optional<Timestamp> end = dp::nullopt, usize max_points = 0) {
            auto valid = validate_pipeline_config(config_);
            if (!valid.is_ok())
                return Result<track::VesselTrack>::err(valid.error());

            if (max_points == 0)
                max_points = config_.max_points;

            if (!is_valid_mmsi(mmsi))
                return Result<track::VesselTrack>::err(Error::invalid_mmsi(mmsi));
            if (max_points > config_.max_points_limit) {
                return Result<track::VesselTrack>::err(
                    Error::invalid_argument("max_points must be between 1 and " +
                                            dp::String(std::to_string(config_.max_points_limit))));
            }
            if (start.has_value() && end.has_value() && *end < *start)
                return Result<track::VesselTrack>::err(Error::invalid_argument("time window ends before it starts"));

            TrackQuery query{mmsi, start, end, fetch_limit(max_points, config_.fetch_headroom)};
            auto fetched = source_.fetch(query);
            if (!fetched.is_ok()) {
                echo::category("aistrack.service.track").error("position source failed: ", fetched.error().message);
                return Result<track::VesselTrack>::err(fetched.error());
            }

            track::VesselTrack raw{mmsi, std::move(fetched.value())};
            if (!raw.is_time_ordered()) {
                echo::category("aistrack.service.track").warn("position source returned unordered rows for ", mmsi);
                return Result<track::VesselTrack>::err(
                    Error::unordered("positions for " + mmsi + " are not in ascending time order"));
            }

            auto cleaned = track::sanitize(raw.points, track::SanitizeOptions{}
                                                           .max_speed(config_.max_speed_kph)
                                                           .points(max_points));
            if (!cleaned.is_ok())
                return Result<track::VesselTrack>::err(cleaned.error());

            echo::category("aistrack.service.track")
                .debug("track ", mmsi, ": fetched=", raw.size(), " served=", cleaned.value().size());
            return Result<track::VesselTrack>::ok(track::VesselTrack{mmsi, std::move(cleaned.value())});
        }

        Result<encode::FeatureCollection> positions(const Mmsi &mmsi, dp::Optional<Timestamp> start = dp::nullopt,
                                                    dp::Optional<Timestamp> end = dp::nullopt, usize max_points = 0) {
            auto t = clean_track(mmsi, start, end, max_points);
            if (!t.is_ok())
                return Result<encode::FeatureCollection>::err(t.error());
            return Result<encode::FeatureCollection>::ok(encode::encode(t.value().points));
        }

        // The animation layer is optional: when it cannot be built the map is
        // still returned, without it.
        Result<encode::MapView> map(const Mmsi &mmsi, dp::Optional<Timestamp> start = dp::nullopt,
                                    dp::Optional<Timestamp> end = dp::nullopt, usize max_points = 0) {
            auto fc = positions(mmsi, start, end, max_points);
            if (!fc.is_ok())
                return Result<encode::MapView>::err(fc.error());

            auto view = encode::build_map_view(fc.value());
            auto layer = encode::attach_timestamped_layer(view, fc.value(), config_.period);
            if (!layer.is_ok())
                echo::category("aistrack.render").info("map for ", mmsi, " without animation: ", layer.error().message);
            return Result<encode::MapView>::ok(std::move(view));
        }
    };

} // namespace aistrack::service
