#pragma once

#include "../util/numeric.hpp"
#include "constants.hpp"
#include "error.hpp"
#include "types.hpp"
#include <cmath>
#include <cstdlib>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>
#include <utility>

namespace aistrack {

    // ─── Pipeline configuration ─────────────────────────────────────────────────
    // Built once at process start and handed to the services that need it.
    struct PipelineConfig {
        f64 max_speed_kph = DEFAULT_MAX_SPEED_KPH;
        usize max_points = DEFAULT_MAX_POINTS;
        usize max_points_limit = MAX_POINTS_LIMIT;
        usize fetch_headroom = DEFAULT_FETCH_HEADROOM; // rows fetched = max_points * headroom
        usize csv_chunk_size = DEFAULT_CSV_CHUNK_SIZE;
        dp::String period = "PT1S"; // timestamped layer step

        // Fluent API
        PipelineConfig &set_max_speed_kph(f64 kph) {
            max_speed_kph = kph;
            return *this;
        }
        PipelineConfig &set_max_points(usize n) {
            max_points = n;
            return *this;
        }
        PipelineConfig &set_max_points_limit(usize n) {
            max_points_limit = n;
            return *this;
        }
        PipelineConfig &set_fetch_headroom(usize factor) {
            fetch_headroom = factor;
            return *this;
        }
        PipelineConfig &set_csv_chunk_size(usize rows) {
            csv_chunk_size = rows;
            return *this;
        }
        PipelineConfig &set_period(dp::String p) {
            period = std::move(p);
            return *this;
        }

        // Overlays AISTRACK_* environment variables on the defaults
        static Result<PipelineConfig> from_env() { return from_env(PipelineConfig{}); }

        static Result<PipelineConfig> from_env(PipelineConfig base) {
            auto read_f64 = [](const char *name, f64 &out) -> Result<void> {
                const char *v = std::getenv(name);
                if (!v)
                    return {};
                auto parsed = util::parse_f64(dp::String(v));
                if (!parsed.has_value())
                    return Result<void>::err(
                        Error::invalid_config(dp::String(name) + " is not a number: " + dp::String(v)));
                out = *parsed;
                return {};
            };
            auto read_count = [](const char *name, usize &out) -> Result<void> {
                const char *v = std::getenv(name);
                if (!v)
                    return {};
                auto parsed = util::parse_f64(dp::String(v));
                if (!parsed.has_value() || !util::is_integral(*parsed) || *parsed < 0.0)
                    return Result<void>::err(
                        Error::invalid_config(dp::String(name) + " is not a non-negative integer: " + dp::String(v)));
                out = static_cast<usize>(*parsed);
                return {};
            };

            Result<void> r = read_f64("AISTRACK_MAX_SPEED_KPH", base.max_speed_kph);
            if (r.is_ok())
                r = read_count("AISTRACK_MAX_POINTS", base.max_points);
            if (r.is_ok())
                r = read_count("AISTRACK_MAX_POINTS_LIMIT", base.max_points_limit);
            if (r.is_ok())
                r = read_count("AISTRACK_FETCH_HEADROOM", base.fetch_headroom);
            if (r.is_ok())
                r = read_count("AISTRACK_CSV_CHUNK_SIZE", base.csv_chunk_size);
            if (!r.is_ok()) {
                echo::category("aistrack.config").error("environment override rejected: ", r.error().message);
                return Result<PipelineConfig>::err(r.error());
            }
            return Result<PipelineConfig>::ok(std::move(base));
        }
    };

    inline Result<void> validate_pipeline_config(const PipelineConfig &config) {
        dp::String problem;
        if (!(config.max_speed_kph > 0.0) || !std::isfinite(config.max_speed_kph))
            problem = "max_speed_kph must be positive";
        else if (config.max_points == 0)
            problem = "max_points must be at least 1";
        else if (config.max_points > config.max_points_limit)
            problem = "max_points exceeds max_points_limit";
        else if (config.fetch_headroom == 0)
            problem = "fetch_headroom must be at least 1";
        else if (config.csv_chunk_size == 0)
            problem = "csv_chunk_size must be at least 1";

        if (!problem.empty()) {
            echo::category("aistrack.config").warn("invalid pipeline config: ", problem);
            return Result<void>::err(Error::invalid_config(problem));
        }
        return {};
    }

} // namespace aistrack
