#pragma once

#include "../core/record.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <nlohmann/json.hpp>

namespace aistrack::encode {

    // ─── Feature properties (any may be null) ───────────────────────────────────
    struct FeatureProperties {
        OptText timestamp; // normalized ISO-8601
        OptF64 speed;      // SOG, knots
        OptF64 course;     // COG, degrees
        OptF64 heading;    // degrees

        bool operator==(const FeatureProperties &) const = default;
    };

    // ─── Point feature; coordinates are (longitude, latitude) ──────────────────
    struct GeoFeature {
        f64 longitude = 0.0;
        f64 latitude = 0.0;
        FeatureProperties properties;

        bool operator==(const GeoFeature &) const = default;

        nlohmann::json to_json() const {
            auto opt = [](const OptF64 &v) -> nlohmann::json { return v.has_value() ? nlohmann::json(*v) : nullptr; };
            nlohmann::json props = {
                {"timestamp",
                 properties.timestamp.has_value() ? nlohmann::json(properties.timestamp->c_str()) : nullptr},
                {"speed", opt(properties.speed)},
                {"course", opt(properties.course)},
                {"heading", opt(properties.heading)},
            };
            return nlohmann::json{
                {"type", "Feature"},
                {"geometry", {{"type", "Point"}, {"coordinates", nlohmann::json::array({longitude, latitude})}}},
                {"properties", std::move(props)},
            };
        }
    };

    struct FeatureCollection {
        dp::Vector<GeoFeature> features;

        usize size() const noexcept { return features.size(); }
        bool empty() const noexcept { return features.empty(); }

        nlohmann::json to_json() const {
            nlohmann::json list = nlohmann::json::array();
            for (const auto &f : features)
                list.push_back(f.to_json());
            return nlohmann::json{{"type", "FeatureCollection"}, {"features", std::move(list)}};
        }

        dp::String dump(int indent = -1) const { return dp::String(to_json().dump(indent)); }
    };

    // ─── Encoding ────────────────────────────────────────────────────────────────
    // Order preserving. Points without latitude or longitude are skipped; missing
    // motion attributes become null properties.
    inline FeatureCollection encode(const dp::Vector<TrackPoint> &track) {
        FeatureCollection fc;
        fc.features.reserve(track.size());
        for (const auto &p : track) {
            if (!p.has_position())
                continue;
            GeoFeature f;
            f.longitude = *p.lon;
            f.latitude = *p.lat;
            if (p.timestamp.has_value())
                f.properties.timestamp = p.timestamp->to_iso8601();
            f.properties.speed = p.sog;
            f.properties.course = p.cog;
            f.properties.heading = p.heading;
            fc.features.push_back(std::move(f));
        }
        echo::category("aistrack.encode").trace("encoded ", fc.size(), " of ", track.size(), " points");
        return fc;
    }

    inline FeatureCollection encode(const dp::Vector<CleanedPositionRecord> &track) {
        return encode(to_track_points(track));
    }

} // namespace aistrack::encode
