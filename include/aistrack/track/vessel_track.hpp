#pragma once

#include "../core/error.hpp"
#include "../core/record.hpp"
#include "../core/types.hpp"
#include <concord/concord.hpp>
#include <datapod/datapod.hpp>
#include <utility>

namespace aistrack::track {

    // ─── One vessel's ordered positions ─────────────────────────────────────────
    struct VesselTrack {
        Mmsi mmsi;
        dp::Vector<TrackPoint> points;

        usize size() const noexcept { return points.size(); }
        bool empty() const noexcept { return points.empty(); }

        // Non-decreasing timestamps; points without a timestamp are ignored
        bool is_time_ordered() const noexcept {
            const Timestamp *prev = nullptr;
            for (const auto &p : points) {
                if (!p.timestamp.has_value())
                    continue;
                if (prev && *p.timestamp < *prev)
                    return false;
                prev = &*p.timestamp;
            }
            return true;
        }

        // Local metric frame about `reference`, for renderers that draw in metres.
        // Points without a position are skipped.
        dp::Vector<concord::frame::ENU> to_enu_batch(const dp::Geo &reference) const {
            dp::Vector<concord::frame::ENU> results;
            results.reserve(points.size());
            for (const auto &p : points) {
                auto position = p.wgs();
                if (position.has_value())
                    results.push_back(concord::frame::to_enu(reference, *position));
            }
            return results;
        }

        // Groups cleaned rows of one vessel; rows of other vessels are rejected
        static Result<VesselTrack> from_records(const Mmsi &mmsi, const dp::Vector<CleanedPositionRecord> &records) {
            VesselTrack t;
            t.mmsi = mmsi;
            t.points.reserve(records.size());
            for (const auto &rec : records) {
                if (rec.mmsi != mmsi) {
                    return Result<VesselTrack>::err(
                        Error::invalid_argument("record of vessel " + rec.mmsi + " in track of " + mmsi));
                }
                t.points.push_back(TrackPoint::from(rec));
            }
            return Result<VesselTrack>::ok(std::move(t));
        }
    };

} // namespace aistrack::track
