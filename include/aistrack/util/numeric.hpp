#pragma once

#include "../core/types.hpp"
#include <charconv>
#include <cmath>
#include <system_error>
#include <datapod/datapod.hpp>
#include <string>

namespace aistrack {
    namespace util {

        // ─── Text -> number coercion ─────────────────────────────────────────────────
        // Plain decimal only: optional sign, digits, fraction, exponent.
        // Leading/trailing blanks are tolerated; hex, inf/nan words or anything
        // after the number make the whole value unparsable. Locale independent.
        inline dp::Optional<f64> parse_f64(const dp::String &text) {
            usize begin = 0;
            usize end = text.size();
            while (begin < end && (text[begin] == ' ' || text[begin] == '\t'))
                ++begin;
            while (end > begin && (text[end - 1] == ' ' || text[end - 1] == '\t'))
                --end;
            const bool plus = begin < end && text[begin] == '+';
            if (plus)
                ++begin;
            if (begin == end)
                return dp::nullopt;

            const char *first = text.c_str() + begin;
            const char *last = text.c_str() + end;
            const char *digits = (!plus && *first == '-') ? first + 1 : first;
            if (digits == last || !((*digits >= '0' && *digits <= '9') || *digits == '.'))
                return dp::nullopt;

            f64 value = 0.0;
            auto res = std::from_chars(first, last, value, std::chars_format::general);
            if (res.ec != std::errc() || res.ptr != last)
                return dp::nullopt;
            return value;
        }

        inline dp::Optional<f64> parse_f64(const dp::Optional<dp::String> &text) {
            if (!text.has_value())
                return dp::nullopt;
            return parse_f64(*text);
        }

        // Shortest text that parses back to exactly the same double
        inline dp::String format_f64(f64 value) {
            char buf[32];
            auto res = std::to_chars(buf, buf + sizeof(buf), value);
            return dp::String(std::string(buf, res.ptr));
        }

        inline dp::Optional<dp::String> format_f64(const dp::Optional<f64> &value) {
            if (!value.has_value())
                return dp::nullopt;
            return format_f64(*value);
        }

        inline bool is_integral(f64 value) noexcept { return std::isfinite(value) && std::floor(value) == value; }

    } // namespace util
} // namespace aistrack
