#pragma once

#include "../util/bitfield.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>

namespace aistrack {

    // ─── Informational record flags ─────────────────────────────────────────────
    // A flag never excludes a row; it only marks it for downstream consumers.
    enum class RecordFlag : u8 {
        ZeroPosition = 0,       // lat == 0 && lon == 0
        MissingNonCritical = 1, // a present descriptive column is null
        SameTimeDuplicate = 2,  // another row shares (mmsi, timestamp)
    };

    inline constexpr RecordFlag ALL_RECORD_FLAGS[] = {RecordFlag::ZeroPosition, RecordFlag::MissingNonCritical,
                                                      RecordFlag::SameTimeDuplicate};

    inline const char *to_string(RecordFlag flag) noexcept {
        switch (flag) {
        case RecordFlag::ZeroPosition:
            return "zero_position";
        case RecordFlag::MissingNonCritical:
            return "missing_non_critical";
        case RecordFlag::SameTimeDuplicate:
            return "same_time_duplicate";
        }
        return "unknown";
    }

    // ─── Flag set (bitfield) ─────────────────────────────────────────────────────
    class FlagSet {
        u8 bits_ = 0;

      public:
        constexpr FlagSet() = default;

        constexpr FlagSet &set(RecordFlag flag) noexcept {
            bits_ = util::bitfield::set_bit(bits_, static_cast<u8>(flag), true);
            return *this;
        }
        constexpr FlagSet &clear(RecordFlag flag) noexcept {
            bits_ = util::bitfield::set_bit(bits_, static_cast<u8>(flag), false);
            return *this;
        }
        constexpr bool has(RecordFlag flag) const noexcept {
            return util::bitfield::get_bit(bits_, static_cast<u8>(flag));
        }

        constexpr bool empty() const noexcept { return bits_ == 0; }
        constexpr u8 size() const noexcept { return util::bitfield::count_bits(bits_); }
        constexpr u8 raw() const noexcept { return bits_; }

        constexpr bool operator==(const FlagSet &) const = default;

        // Canonical storage form: flag names in enum order, comma separated
        dp::String to_string() const {
            dp::String out;
            for (auto flag : ALL_RECORD_FLAGS) {
                if (!has(flag))
                    continue;
                if (!out.empty())
                    out += ",";
                out += aistrack::to_string(flag);
            }
            return out;
        }

        static FlagSet parse(const dp::String &text) {
            FlagSet flags;
            for (auto flag : ALL_RECORD_FLAGS) {
                dp::String name = aistrack::to_string(flag);
                usize pos = 0;
                while ((pos = text.find(name, pos)) != dp::String::npos) {
                    usize end = pos + name.size();
                    bool starts = pos == 0 || text[pos - 1] == ',';
                    bool ends = end == text.size() || text[end] == ',';
                    if (starts && ends) {
                        flags.set(flag);
                        break;
                    }
                    pos = end;
                }
            }
            return flags;
        }
    };

} // namespace aistrack
