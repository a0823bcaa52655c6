#pragma once

#include "constants.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>

namespace aistrack {

    // ─── MMSI validation ─────────────────────────────────────────────────────────
    // The identifier is valid only as exactly nine ASCII digits. Numeric forms
    // such as "211000000.0" or " 211000000" are rejected.
    inline bool is_valid_mmsi(const dp::String &text) noexcept {
        if (text.size() != MMSI_DIGITS)
            return false;
        for (usize i = 0; i < text.size(); ++i) {
            if (text[i] < '0' || text[i] > '9')
                return false;
        }
        return true;
    }

    inline bool is_valid_mmsi(u64 value) noexcept { return value >= 100000000ULL && value <= 999999999ULL; }

} // namespace aistrack
