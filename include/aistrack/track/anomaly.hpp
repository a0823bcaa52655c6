#pragma once

#include "../core/constants.hpp"
#include "../core/record.hpp"
#include "../core/types.hpp"
#include "../geo/haversine.hpp"
#include <algorithm>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <nlohmann/json.hpp>

namespace aistrack::track {

    enum class AnomalyType : u8 {
        HighSpeed,              // reported SOG above HIGH_SPEED_KNOTS
        CogJump,                // course change above COG_JUMP_DEG within 5 minutes
        DuplicateMmsiTimestamp, // several rows for one (mmsi, timestamp)
    };

    inline const char *to_string(AnomalyType t) noexcept {
        switch (t) {
        case AnomalyType::HighSpeed:
            return "high_speed";
        case AnomalyType::CogJump:
            return "cog_jump";
        case AnomalyType::DuplicateMmsiTimestamp:
            return "duplicate_mmsi_timestamp";
        }
        return "unknown";
    }

    struct Anomaly {
        Mmsi mmsi;
        Timestamp timestamp;
        AnomalyType type = AnomalyType::HighSpeed;
        OptF64 sog;
        OptF64 prev_cog;
        OptF64 cur_cog;
        OptF64 diff;
        usize count = 0;

        nlohmann::json details_json() const {
            nlohmann::json d = nlohmann::json::object();
            switch (type) {
            case AnomalyType::HighSpeed:
                d["sog"] = *sog;
                break;
            case AnomalyType::CogJump:
                d["prev_cog"] = *prev_cog;
                d["cur_cog"] = *cur_cog;
                d["diff"] = *diff;
                break;
            case AnomalyType::DuplicateMmsiTimestamp:
                d["count"] = count;
                break;
            }
            return d;
        }

        nlohmann::json to_json() const {
            return nlohmann::json{{"mmsi", mmsi.c_str()},
                                  {"event_time", timestamp.to_iso8601().c_str()},
                                  {"anomaly_type", to_string(type)},
                                  {"details", details_json()}};
        }
    };

    // ─── Anomaly detection ───────────────────────────────────────────────────────
    // Works on any mix of vessels. Events come grouped by rule (high speed, course
    // jumps, duplicates), each group in (mmsi, timestamp) order.
    inline dp::Vector<Anomaly> detect_anomalies(const dp::Vector<CleanedPositionRecord> &records) {
        dp::Vector<const CleanedPositionRecord *> ordered;
        ordered.reserve(records.size());
        for (const auto &rec : records)
            ordered.push_back(&rec);
        std::stable_sort(ordered.begin(), ordered.end(),
                         [](const CleanedPositionRecord *a, const CleanedPositionRecord *b) {
                             if (a->mmsi != b->mmsi)
                                 return a->mmsi < b->mmsi;
                             return a->timestamp < b->timestamp;
                         });

        dp::Vector<Anomaly> events;

        for (const auto *rec : ordered) {
            if (rec->sog.has_value() && *rec->sog > HIGH_SPEED_KNOTS) {
                Anomaly a;
                a.mmsi = rec->mmsi;
                a.timestamp = rec->timestamp;
                a.type = AnomalyType::HighSpeed;
                a.sog = rec->sog;
                events.push_back(std::move(a));
            }
        }

        for (usize i = 1; i < ordered.size(); ++i) {
            const auto *prev = ordered[i - 1];
            const auto *cur = ordered[i];
            if (prev->mmsi != cur->mmsi || !prev->cog.has_value() || !cur->cog.has_value())
                continue;
            if (cur->timestamp.micros - prev->timestamp.micros > COG_JUMP_WINDOW_US)
                continue;
            const f64 diff = geo::course_change_deg(*prev->cog, *cur->cog);
            if (diff > COG_JUMP_DEG) {
                Anomaly a;
                a.mmsi = cur->mmsi;
                a.timestamp = cur->timestamp;
                a.type = AnomalyType::CogJump;
                a.prev_cog = prev->cog;
                a.cur_cog = cur->cog;
                a.diff = diff;
                events.push_back(std::move(a));
            }
        }

        usize i = 0;
        while (i < ordered.size()) {
            usize j = i + 1;
            while (j < ordered.size() && ordered[j]->mmsi == ordered[i]->mmsi &&
                   ordered[j]->timestamp == ordered[i]->timestamp)
                ++j;
            if (j - i > 1) {
                Anomaly a;
                a.mmsi = ordered[i]->mmsi;
                a.timestamp = ordered[i]->timestamp;
                a.type = AnomalyType::DuplicateMmsiTimestamp;
                a.count = j - i;
                events.push_back(std::move(a));
            }
            i = j;
        }

        echo::category("aistrack.track.anomaly")
            .debug("detected ", events.size(), " anomalies in ", records.size(), " records");
        return events;
    }

} // namespace aistrack::track
