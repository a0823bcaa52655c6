#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "feature.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace aistrack::encode {

    inline constexpr u8 EMPTY_MAP_ZOOM = 2;
    inline constexpr u8 TRACK_MAP_ZOOM = 6;

    struct LatLon {
        f64 lat = 0.0;
        f64 lon = 0.0;
    };

    struct Marker {
        LatLon position;
        dp::String popup;
    };

    // ─── Renderer-agnostic map description ──────────────────────────────────────
    struct MapView {
        LatLon center;
        u8 zoom = EMPTY_MAP_ZOOM;
        dp::Vector<LatLon> path; // polyline in (lat, lon) order
        dp::Vector<Marker> markers;
        dp::Optional<nlohmann::json> timestamped_layer;

        bool has_timestamped_layer() const noexcept { return timestamped_layer.has_value(); }
    };

    // ─── Timestamped animation layer ────────────────────────────────────────────
    // Needs every feature to carry a timestamp. Failure is returned, not
    // swallowed, so the caller decides whether a map without animation is fine.
    inline Result<nlohmann::json> build_timestamped_layer(const FeatureCollection &fc, const dp::String &period) {
        if (fc.empty())
            return Result<nlohmann::json>::err(Error::render_error("no features to animate"));

        nlohmann::json features = nlohmann::json::array();
        for (usize i = 0; i < fc.features.size(); ++i) {
            const auto &f = fc.features[i];
            if (!f.properties.timestamp.has_value()) {
                return Result<nlohmann::json>::err(
                    Error::render_error("feature " + dp::String(std::to_string(i)) + " has no timestamp"));
            }
            nlohmann::json feature = f.to_json();
            feature["properties"]["time"] = f.properties.timestamp->c_str();
            features.push_back(std::move(feature));
        }

        nlohmann::json layer = {
            {"type", "FeatureCollection"},
            {"features", std::move(features)},
            {"period", period.c_str()},
            {"add_last_point", true},
        };
        return Result<nlohmann::json>::ok(std::move(layer));
    }

    inline dp::String popup_text(const FeatureProperties &p) {
        auto num = [](const OptF64 &v) -> std::string { return v.has_value() ? std::to_string(*v) : "None"; };
        std::string text = "<b>time</b>: ";
        text += p.timestamp.has_value() ? p.timestamp->c_str() : "None";
        text += "<br><b>sog</b>: " + num(p.speed);
        text += "<br><b>cog</b>: " + num(p.course);
        return dp::String(text);
    }

    // Map without the animation layer; see attach_timestamped_layer
    inline MapView build_map_view(const FeatureCollection &fc) {
        MapView view;
        if (fc.empty()) {
            echo::category("aistrack.render").debug("empty collection, world view");
            return view;
        }

        f64 sum_lat = 0.0, sum_lon = 0.0;
        view.path.reserve(fc.size());
        view.markers.reserve(fc.size());
        for (const auto &f : fc.features) {
            sum_lat += f.latitude;
            sum_lon += f.longitude;
            LatLon ll{f.latitude, f.longitude};
            view.path.push_back(ll);
            view.markers.push_back(Marker{ll, popup_text(f.properties)});
        }
        const f64 n = static_cast<f64>(fc.size());
        view.center = LatLon{sum_lat / n, sum_lon / n};
        view.zoom = TRACK_MAP_ZOOM;
        return view;
    }

    inline Result<void> attach_timestamped_layer(MapView &view, const FeatureCollection &fc,
                                                 const dp::String &period) {
        auto layer = build_timestamped_layer(fc, period);
        if (!layer.is_ok())
            return Result<void>::err(layer.error());
        view.timestamped_layer = std::move(layer.value());
        return {};
    }

} // namespace aistrack::encode
