#pragma once

#include "constants.hpp"
#include "error.hpp"
#include "types.hpp"
#include <compare>
#include <cstdio>
#include <datapod/datapod.hpp>
#include <string>

namespace aistrack {

    // ─── Civil calendar helpers (proleptic Gregorian) ──────────────────────────
    namespace civil {

        constexpr i64 days_from_civil(i64 y, u32 m, u32 d) noexcept {
            y -= m <= 2 ? 1 : 0;
            const i64 era = (y >= 0 ? y : y - 399) / 400;
            const u32 yoe = static_cast<u32>(y - era * 400);
            const u32 doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
            const u32 doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<i64>(doe) - 719468;
        }

        struct Date {
            i64 year = 1970;
            u32 month = 1;
            u32 day = 1;
        };

        constexpr Date civil_from_days(i64 z) noexcept {
            z += 719468;
            const i64 era = (z >= 0 ? z : z - 146096) / 146097;
            const u32 doe = static_cast<u32>(z - era * 146097);
            const u32 yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const u32 doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const u32 mp = (5 * doy + 2) / 153;
            const u32 d = doy - (153 * mp + 2) / 5 + 1;
            const u32 m = mp < 10 ? mp + 3 : mp - 9;
            return Date{static_cast<i64>(yoe) + era * 400 + (m <= 2 ? 1 : 0), m, d};
        }

        constexpr bool is_leap(i64 y) noexcept { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

        constexpr u32 days_in_month(i64 y, u32 m) noexcept {
            constexpr u32 table[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            return (m == 2 && is_leap(y)) ? 29 : table[m - 1];
        }

    } // namespace civil

    // ─── UTC instant, microsecond resolution ────────────────────────────────────
    struct Timestamp {
        EpochMicros micros = 0;

        constexpr Timestamp() = default;
        constexpr explicit Timestamp(EpochMicros us) : micros(us) {}

        static constexpr Timestamp from_seconds(i64 s) noexcept { return Timestamp(s * MICROS_PER_SECOND); }

        static constexpr Timestamp from_civil(i64 y, u32 mo, u32 d, u32 h = 0, u32 mi = 0, u32 s = 0,
                                              u32 us = 0) noexcept {
            i64 days = civil::days_from_civil(y, mo, d);
            i64 secs = days * 86400 + static_cast<i64>(h) * 3600 + static_cast<i64>(mi) * 60 + s;
            return Timestamp(secs * MICROS_PER_SECOND + us);
        }

        constexpr f64 seconds_since(const Timestamp &earlier) const noexcept {
            return static_cast<f64>(micros - earlier.micros) / static_cast<f64>(MICROS_PER_SECOND);
        }

        constexpr Timestamp plus_seconds(i64 s) const noexcept { return Timestamp(micros + s * MICROS_PER_SECOND); }

        constexpr auto operator<=>(const Timestamp &) const = default;

        // Accepts YYYY-MM-DD[T| ]HH:MM:SS[.f{1,6}][Z|+HH:MM|-HH:MM].
        // Text without an offset is taken as UTC.
        static Result<Timestamp> parse(const dp::String &text) {
            auto fail = [&text]() {
                return Result<Timestamp>::err(Error::parse_error("invalid ISO8601 timestamp: " + text));
            };

            const char *s = text.c_str();
            const usize n = text.size();
            auto digits = [&](usize pos, usize count, u32 &out) -> bool {
                if (pos + count > n)
                    return false;
                u32 v = 0;
                for (usize i = 0; i < count; ++i) {
                    char c = s[pos + i];
                    if (c < '0' || c > '9')
                        return false;
                    v = v * 10 + static_cast<u32>(c - '0');
                }
                out = v;
                return true;
            };

            u32 year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
            if (!digits(0, 4, year) || n < 19 || s[4] != '-' || !digits(5, 2, month) || s[7] != '-' ||
                !digits(8, 2, day) || (s[10] != 'T' && s[10] != ' ') || !digits(11, 2, hour) || s[13] != ':' ||
                !digits(14, 2, minute) || s[16] != ':' || !digits(17, 2, second)) {
                return fail();
            }
            if (month < 1 || month > 12 || day < 1 || day > civil::days_in_month(year, month) || hour > 23 ||
                minute > 59 || second > 59) {
                return fail();
            }

            usize pos = 19;
            u32 fraction_us = 0;
            if (pos < n && s[pos] == '.') {
                ++pos;
                usize count = 0;
                u32 scale = 100000;
                while (pos < n && s[pos] >= '0' && s[pos] <= '9') {
                    if (count < 6) {
                        fraction_us += static_cast<u32>(s[pos] - '0') * scale;
                        scale /= 10;
                    }
                    ++count;
                    ++pos;
                }
                if (count == 0)
                    return fail();
            }

            i64 offset_s = 0;
            if (pos < n) {
                if (s[pos] == 'Z' && pos + 1 == n) {
                    pos = n;
                } else if (s[pos] == '+' || s[pos] == '-') {
                    u32 oh = 0, om = 0;
                    if (!digits(pos + 1, 2, oh) || pos + 3 >= n || s[pos + 3] != ':' || !digits(pos + 4, 2, om) ||
                        pos + 6 != n || oh > 23 || om > 59) {
                        return fail();
                    }
                    offset_s = static_cast<i64>(oh) * 3600 + static_cast<i64>(om) * 60;
                    if (s[pos] == '-')
                        offset_s = -offset_s;
                    pos = n;
                } else {
                    return fail();
                }
            }

            Timestamp local = from_civil(year, month, day, hour, minute, second, fraction_us);
            return Result<Timestamp>::ok(Timestamp(local.micros - offset_s * MICROS_PER_SECOND));
        }

        // Normalized text: YYYY-MM-DDTHH:MM:SS[.ffffff]+00:00
        dp::String to_iso8601() const {
            i64 secs = micros / MICROS_PER_SECOND;
            i64 frac = micros % MICROS_PER_SECOND;
            if (frac < 0) {
                frac += MICROS_PER_SECOND;
                secs -= 1;
            }
            i64 days = secs / 86400;
            i64 sod = secs % 86400;
            if (sod < 0) {
                sod += 86400;
                days -= 1;
            }
            civil::Date date = civil::civil_from_days(days);

            char buf[48];
            int len = 0;
            if (frac != 0) {
                len = std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%06lld+00:00",
                                    static_cast<long long>(date.year), date.month, date.day,
                                    static_cast<long long>(sod / 3600), static_cast<long long>((sod / 60) % 60),
                                    static_cast<long long>(sod % 60), static_cast<long long>(frac));
            } else {
                len = std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld+00:00",
                                    static_cast<long long>(date.year), date.month, date.day,
                                    static_cast<long long>(sod / 3600), static_cast<long long>((sod / 60) % 60),
                                    static_cast<long long>(sod % 60));
            }
            return dp::String(std::string(buf, static_cast<usize>(len > 0 ? len : 0)));
        }
    };

} // namespace aistrack
