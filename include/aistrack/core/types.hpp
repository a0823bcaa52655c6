#pragma once

#include <datapod/datapod.hpp>

namespace aistrack {

    // ─── Numeric type aliases ────────────────────────────────────────────────────
    using dp::f32;
    using dp::f64;
    using dp::i16;
    using dp::i32;
    using dp::i64;
    using dp::i8;
    using dp::isize;
    using dp::u16;
    using dp::u32;
    using dp::u64;
    using dp::u8;
    using dp::usize;

    // ─── Domain-specific types ───────────────────────────────────────────────────
    using Mmsi = dp::String;  // 9 ASCII digits once validated
    using EpochMicros = i64;  // UTC microseconds since 1970-01-01

} // namespace aistrack
