#pragma once

#include "../core/constants.hpp"
#include "../core/record.hpp"
#include "../core/types.hpp"
#include "../util/numeric.hpp"
#include <cctype>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace aistrack::validate {

    // ─── Staging normalization ───────────────────────────────────────────────────
    // Applied to cleaned rows before analytics. Out-of-range values become null,
    // text columns are trimmed and case-folded. No row is ever dropped.

    namespace detail {

        inline dp::String trim(const dp::String &text) {
            usize begin = 0;
            usize end = text.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
                ++begin;
            while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
                --end;
            return text.substr(begin, end - begin);
        }

        inline OptText trimmed_or_null(const OptText &text) {
            if (!text.has_value())
                return dp::nullopt;
            dp::String t = trim(*text);
            if (t.empty())
                return dp::nullopt;
            return t;
        }

        template <typename Fold> OptText fold_case(const OptText &text, Fold fold) {
            auto t = trimmed_or_null(text);
            if (!t.has_value())
                return dp::nullopt;
            dp::String out = *t;
            for (usize i = 0; i < out.size(); ++i)
                out[i] = static_cast<char>(fold(static_cast<unsigned char>(out[i])));
            return out;
        }

        inline OptF64 within(const OptF64 &v, f64 lo, f64 hi_inclusive) {
            if (v.has_value() && *v >= lo && *v <= hi_inclusive)
                return v;
            return dp::nullopt;
        }

        // Keeps a numeric text column when its value is integral within [lo, hi]
        inline OptText integral_code(const OptText &text, f64 lo, f64 hi) {
            auto v = util::parse_f64(text);
            if (!v.has_value() || !util::is_integral(*v) || *v < lo || *v > hi)
                return dp::nullopt;
            return dp::String(std::to_string(static_cast<i64>(*v)));
        }

        // IMO followed by exactly seven digits
        inline bool is_imo_number(const dp::String &text) {
            if (text.size() != 10 || text.substr(0, 3) != "IMO")
                return false;
            for (usize i = 3; i < text.size(); ++i) {
                if (text[i] < '0' || text[i] > '9')
                    return false;
            }
            return true;
        }

    } // namespace detail

    inline CleanedPositionRecord normalize_record(const CleanedPositionRecord &in) {
        CleanedPositionRecord rec = in;

        rec.sog = detail::within(in.sog, 0.0, SOG_MAX_KNOTS);
        rec.cog = (in.cog.has_value() && *in.cog >= 0.0 && *in.cog < COG_MAX_DEG) ? in.cog : OptF64{};
        // 511 is the AIS "heading not available" sentinel; it lands outside the range
        rec.heading = (in.heading.has_value() && util::is_integral(*in.heading))
                          ? detail::within(in.heading, 0.0, HEADING_MAX_DEG)
                          : OptF64{};

        auto &d = rec.details;
        d.vessel_name = detail::fold_case(in.details.vessel_name, [](unsigned char c) { return std::tolower(c); });
        d.call_sign = detail::fold_case(in.details.call_sign, [](unsigned char c) { return std::toupper(c); });

        auto imo = detail::trimmed_or_null(in.details.imo);
        d.imo = (imo.has_value() && detail::is_imo_number(*imo)) ? imo : OptText{};

        d.vessel_type = detail::integral_code(in.details.vessel_type, 0.0, VESSEL_TYPE_MAX);
        d.status = detail::integral_code(in.details.status, 0.0, NAV_STATUS_MAX);

        auto cargo = util::parse_f64(in.details.cargo);
        d.cargo = (cargo.has_value() && *cargo != 0.0 && util::is_integral(*cargo))
                      ? OptText{dp::String(std::to_string(static_cast<i64>(*cargo)))}
                      : OptText{};

        rec.transceiver_class = detail::trimmed_or_null(in.transceiver_class);
        return rec;
    }

    inline dp::Vector<CleanedPositionRecord> normalize_batch(const dp::Vector<CleanedPositionRecord> &records) {
        dp::Vector<CleanedPositionRecord> out;
        out.reserve(records.size());
        usize nulled_motion = 0;
        for (const auto &rec : records) {
            out.push_back(normalize_record(rec));
            const auto &n = out.back();
            if (n.sog != rec.sog || n.cog != rec.cog || n.heading != rec.heading)
                ++nulled_motion;
        }
        echo::category("aistrack.normalize")
            .debug("normalized ", out.size(), " records, motion fields nulled on ", nulled_motion);
        return out;
    }

} // namespace aistrack::validate
