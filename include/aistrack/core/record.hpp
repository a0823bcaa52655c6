#pragma once

#include "flags.hpp"
#include "timestamp.hpp"
#include "types.hpp"
#include "../util/numeric.hpp"
#include <concord/concord.hpp>
#include <datapod/datapod.hpp>
#include <utility>

namespace aistrack {

    using OptText = dp::Optional<dp::String>;
    using OptF64 = dp::Optional<f64>;

    // ─── Non-critical descriptive columns ───────────────────────────────────────
    enum class NonCriticalField : u8 {
        VesselName = 0,
        Imo,
        CallSign,
        VesselType,
        Length,
        Width,
        Draft,
        Cargo,
        Destination,
        Eta,
        NavigationalStatus,
    };

    inline constexpr usize NON_CRITICAL_FIELD_COUNT = 11;

    inline constexpr NonCriticalField ALL_NON_CRITICAL_FIELDS[NON_CRITICAL_FIELD_COUNT] = {
        NonCriticalField::VesselName, NonCriticalField::Imo,         NonCriticalField::CallSign,
        NonCriticalField::VesselType, NonCriticalField::Length,      NonCriticalField::Width,
        NonCriticalField::Draft,      NonCriticalField::Cargo,       NonCriticalField::Destination,
        NonCriticalField::Eta,        NonCriticalField::NavigationalStatus};

    // Column names as they appear in AIS CSV exports
    inline const char *column_name(NonCriticalField field) noexcept {
        switch (field) {
        case NonCriticalField::VesselName:
            return "VesselName";
        case NonCriticalField::Imo:
            return "IMO";
        case NonCriticalField::CallSign:
            return "CallSign";
        case NonCriticalField::VesselType:
            return "VesselType";
        case NonCriticalField::Length:
            return "Length";
        case NonCriticalField::Width:
            return "Width";
        case NonCriticalField::Draft:
            return "Draft";
        case NonCriticalField::Cargo:
            return "Cargo";
        case NonCriticalField::Destination:
            return "Destination";
        case NonCriticalField::Eta:
            return "ETA";
        case NonCriticalField::NavigationalStatus:
            return "Status";
        }
        return "";
    }

    // ─── Batch schema: which non-critical columns a batch actually carries ──────
    class BatchSchema {
        u16 present_ = 0;

      public:
        constexpr BatchSchema() = default;

        static constexpr BatchSchema none() noexcept { return BatchSchema{}; }

        static constexpr BatchSchema all() noexcept {
            BatchSchema s;
            for (auto f : ALL_NON_CRITICAL_FIELDS)
                s.add(f);
            return s;
        }

        constexpr BatchSchema &add(NonCriticalField field) noexcept {
            present_ = util::bitfield::set_bit(present_, static_cast<u8>(field), true);
            return *this;
        }

        constexpr bool has(NonCriticalField field) const noexcept {
            return util::bitfield::get_bit(present_, static_cast<u8>(field));
        }

        constexpr bool empty() const noexcept { return present_ == 0; }

        constexpr bool operator==(const BatchSchema &) const = default;
    };

    // ─── Descriptive vessel data (varies by source) ─────────────────────────────
    struct VesselDetails {
        OptText vessel_name;
        OptText imo;
        OptText call_sign;
        OptText vessel_type;
        OptText length;
        OptText width;
        OptText draft;
        OptText cargo;
        OptText destination;
        OptText eta;
        OptText status;

        const OptText &field(NonCriticalField f) const noexcept {
            switch (f) {
            case NonCriticalField::VesselName:
                return vessel_name;
            case NonCriticalField::Imo:
                return imo;
            case NonCriticalField::CallSign:
                return call_sign;
            case NonCriticalField::VesselType:
                return vessel_type;
            case NonCriticalField::Length:
                return length;
            case NonCriticalField::Width:
                return width;
            case NonCriticalField::Draft:
                return draft;
            case NonCriticalField::Cargo:
                return cargo;
            case NonCriticalField::Destination:
                return destination;
            case NonCriticalField::Eta:
                return eta;
            case NonCriticalField::NavigationalStatus:
                return status;
            }
            return status;
        }

        OptText &field(NonCriticalField f) noexcept {
            return const_cast<OptText &>(static_cast<const VesselDetails &>(*this).field(f));
        }

        bool operator==(const VesselDetails &) const = default;
    };

    // ─── Raw ingestion row ───────────────────────────────────────────────────────
    // Every column is optional text, as delivered by a CSV file or a text-typed
    // raw table. Nothing here has been checked yet.
    struct RawPositionRecord {
        OptText mmsi;
        OptText base_datetime;
        OptText lat;
        OptText lon;
        OptText sog;
        OptText cog;
        OptText heading;
        VesselDetails details;
        OptText transceiver_class;

        bool operator==(const RawPositionRecord &) const = default;
    };

    // ─── Validated row ───────────────────────────────────────────────────────────
    // Invariants: mmsi is 9 digits, lat in [-90, 90], lon in [-180, 180].
    struct CleanedPositionRecord {
        Mmsi mmsi;
        Timestamp timestamp;
        f64 lat = 0.0;
        f64 lon = 0.0;
        OptF64 sog;     // knots
        OptF64 cog;     // degrees
        OptF64 heading; // degrees
        VesselDetails details;
        OptText transceiver_class;
        FlagSet flags;

        concord::earth::WGS wgs() const { return concord::earth::WGS(lat, lon, 0.0); }

        // Lossless text rendering, so a cleaned batch can be fed back through
        // the validator.
        RawPositionRecord to_raw() const {
            RawPositionRecord raw;
            raw.mmsi = mmsi;
            raw.base_datetime = timestamp.to_iso8601();
            raw.lat = util::format_f64(lat);
            raw.lon = util::format_f64(lon);
            raw.sog = util::format_f64(sog);
            raw.cog = util::format_f64(cog);
            raw.heading = util::format_f64(heading);
            raw.details = details;
            raw.transceiver_class = transceiver_class;
            return raw;
        }

        bool operator==(const CleanedPositionRecord &) const = default;
    };

    // ─── Query-time position row ─────────────────────────────────────────────────
    // Projection of a stored cleaned row as a position source returns it.
    // Storage may hand back nulls, so every positional column is optional.
    struct TrackPoint {
        Mmsi mmsi;
        dp::Optional<Timestamp> timestamp;
        OptF64 lat;
        OptF64 lon;
        OptF64 sog;
        OptF64 cog;
        OptF64 heading;

        TrackPoint() = default;
        TrackPoint(Mmsi id, Timestamp ts, f64 latitude, f64 longitude)
            : mmsi(std::move(id)), timestamp(ts), lat(latitude), lon(longitude) {}

        static TrackPoint from(const CleanedPositionRecord &rec) {
            TrackPoint p(rec.mmsi, rec.timestamp, rec.lat, rec.lon);
            p.sog = rec.sog;
            p.cog = rec.cog;
            p.heading = rec.heading;
            return p;
        }

        bool has_position() const noexcept { return lat.has_value() && lon.has_value(); }
        bool is_complete() const noexcept { return has_position() && timestamp.has_value(); }

        // Empty when latitude or longitude is missing
        dp::Optional<concord::earth::WGS> wgs() const {
            if (!has_position())
                return dp::nullopt;
            return concord::earth::WGS(*lat, *lon, 0.0);
        }

        bool operator==(const TrackPoint &) const = default;
    };

    inline dp::Vector<TrackPoint> to_track_points(const dp::Vector<CleanedPositionRecord> &records) {
        dp::Vector<TrackPoint> points;
        points.reserve(records.size());
        for (const auto &rec : records)
            points.push_back(TrackPoint::from(rec));
        return points;
    }

} // namespace aistrack
