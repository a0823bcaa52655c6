#pragma once

#include "../core/constants.hpp"
#include "../core/mmsi.hpp"
#include "../core/record.hpp"
#include "../core/types.hpp"
#include "../util/numeric.hpp"
#include <cmath>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace aistrack::validate {

    // ─── Aggregate outcome of one batch ─────────────────────────────────────────
    struct ValidationReport {
        usize input_rows = 0;
        // Drops
        usize malformed = 0;        // missing/unparsable mmsi or timestamp
        usize invalid_identity = 0; // mmsi not 9 digits
        usize invalid_geodata = 0;  // lat/lon unparsable or out of range
        usize exact_duplicates = 0; // collapsed content-identical rows
        // Flags on retained rows
        usize zero_position = 0;
        usize missing_non_critical = 0;
        usize same_time_duplicate = 0;

        usize dropped() const noexcept { return malformed + invalid_identity + invalid_geodata + exact_duplicates; }
        usize retained() const noexcept { return input_rows - dropped(); }
    };

    struct ValidationResult {
        dp::Vector<CleanedPositionRecord> cleaned;
        usize dropped_count = 0;
        ValidationReport report;
    };

    namespace detail {

        inline OptF64 coerce_motion(const OptText &text) {
            auto v = util::parse_f64(text);
            if (v.has_value() && !std::isfinite(*v))
                return dp::nullopt;
            return v;
        }

        inline bool in_range(f64 lat, f64 lon) noexcept {
            return lat >= LAT_MIN && lat <= LAT_MAX && lon >= LON_MIN && lon <= LON_MAX;
        }

        inline dp::String same_time_key(const CleanedPositionRecord &rec) {
            return rec.mmsi + "|" + dp::String(std::to_string(rec.timestamp.micros));
        }

        inline void append_text(std::string &key, const OptText &v) {
            if (v.has_value()) {
                key += '\x02';
                key += v->c_str();
            } else {
                key += '\x01';
            }
            key += '\x1f';
        }

        inline void append_number(std::string &key, const OptF64 &v) {
            if (v.has_value()) {
                key += '\x02';
                key += util::format_f64(*v).c_str();
            } else {
                key += '\x01';
            }
            key += '\x1f';
        }

        // Canonical content key; two rows collapse only when every field matches
        inline dp::String content_key(const CleanedPositionRecord &rec) {
            std::string key;
            key.reserve(160);
            key += rec.mmsi.c_str();
            key += '\x1f';
            key += std::to_string(rec.timestamp.micros);
            key += '\x1f';
            append_number(key, rec.lat);
            append_number(key, rec.lon);
            append_number(key, rec.sog);
            append_number(key, rec.cog);
            append_number(key, rec.heading);
            for (auto f : ALL_NON_CRITICAL_FIELDS)
                append_text(key, rec.details.field(f));
            append_text(key, rec.transceiver_class);
            key += std::to_string(rec.flags.raw());
            return dp::String(key);
        }

    } // namespace detail

    // ─── Batch validation ────────────────────────────────────────────────────────
    // Turns one raw batch into cleaned rows. Steps run in a fixed order:
    //   1. drop rows without mmsi or a parsable timestamp
    //   2. drop rows whose mmsi is not exactly 9 digits
    //   3. drop rows with non-numeric or out-of-range lat/lon
    //   4-6. flag zero position and missing non-critical columns (only those
    //        in `schema`)
    //   7. flag rows sharing (mmsi, timestamp) with any other row; flagged
    //      rows stay
    //   8. collapse rows identical in every field
    // Relative order is preserved. Duplicate detection is scoped to this batch.
    inline ValidationResult validate_batch(const dp::Vector<RawPositionRecord> &rows,
                                           const BatchSchema &schema = BatchSchema::all()) {
        ValidationResult result;
        ValidationReport &report = result.report;
        report.input_rows = rows.size();

        dp::Vector<CleanedPositionRecord> survivors;
        survivors.reserve(rows.size());

        for (const auto &raw : rows) {
            if (!raw.mmsi.has_value() || !raw.base_datetime.has_value()) {
                ++report.malformed;
                continue;
            }
            auto ts = Timestamp::parse(*raw.base_datetime);
            if (!ts.is_ok()) {
                echo::category("aistrack.validate").trace("unparsable timestamp: ", *raw.base_datetime);
                ++report.malformed;
                continue;
            }

            if (!is_valid_mmsi(*raw.mmsi)) {
                ++report.invalid_identity;
                continue;
            }

            auto lat = util::parse_f64(raw.lat);
            auto lon = util::parse_f64(raw.lon);
            if (!lat.has_value() || !lon.has_value() || !detail::in_range(*lat, *lon)) {
                ++report.invalid_geodata;
                continue;
            }

            CleanedPositionRecord rec;
            rec.mmsi = *raw.mmsi;
            rec.timestamp = ts.value();
            rec.lat = *lat;
            rec.lon = *lon;
            rec.sog = detail::coerce_motion(raw.sog);
            rec.cog = detail::coerce_motion(raw.cog);
            rec.heading = detail::coerce_motion(raw.heading);
            rec.details = raw.details;
            rec.transceiver_class = raw.transceiver_class;

            if (rec.lat == 0.0 && rec.lon == 0.0)
                rec.flags.set(RecordFlag::ZeroPosition);

            for (auto f : ALL_NON_CRITICAL_FIELDS) {
                if (schema.has(f) && !rec.details.field(f).has_value()) {
                    rec.flags.set(RecordFlag::MissingNonCritical);
                    break;
                }
            }

            survivors.push_back(std::move(rec));
        }

        dp::Map<dp::String, usize> per_time;
        for (const auto &rec : survivors)
            per_time[detail::same_time_key(rec)] += 1;
        for (auto &rec : survivors) {
            if (per_time[detail::same_time_key(rec)] > 1)
                rec.flags.set(RecordFlag::SameTimeDuplicate);
        }

        dp::Map<dp::String, bool> seen;
        result.cleaned.reserve(survivors.size());
        for (auto &rec : survivors) {
            dp::String key = detail::content_key(rec);
            if (seen.find(key) != seen.end()) {
                ++report.exact_duplicates;
                continue;
            }
            seen[key] = true;
            result.cleaned.push_back(std::move(rec));
        }

        for (const auto &rec : result.cleaned) {
            if (rec.flags.has(RecordFlag::ZeroPosition))
                ++report.zero_position;
            if (rec.flags.has(RecordFlag::MissingNonCritical))
                ++report.missing_non_critical;
            if (rec.flags.has(RecordFlag::SameTimeDuplicate))
                ++report.same_time_duplicate;
        }

        result.dropped_count = report.input_rows - result.cleaned.size();
        echo::category("aistrack.validate")
            .debug("batch validated: in=", report.input_rows, " kept=", result.cleaned.size(),
                   " malformed=", report.malformed, " invalid_mmsi=", report.invalid_identity,
                   " invalid_geo=", report.invalid_geodata, " duplicates=", report.exact_duplicates);
        return result;
    }

} // namespace aistrack::validate
