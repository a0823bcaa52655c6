#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace aistrack {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    // Only bad calls and collaborator failures are errors. Bad rows are counted
    // or dropped, never reported through these codes.
    enum class ErrorCode : u32 {
        Ok = 0,
        InvalidArgument,
        InvalidConfig,
        InvalidData,
        Unordered,
        NotFound,
        IoError,
        ParseError,
        SourceError,
        SinkError,
        RenderError,
    };

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error invalid_argument(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidArgument, std::move(msg));
        }
        static Error invalid_config(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidConfig, std::move(msg));
        }
        static Error unordered(dp::String msg = "") noexcept { return Error(ErrorCode::Unordered, std::move(msg)); }
        static Error io_error(dp::String msg = "") noexcept { return Error(ErrorCode::IoError, std::move(msg)); }
        static Error parse_error(dp::String msg = "") noexcept {
            return Error(ErrorCode::ParseError, std::move(msg));
        }
        static Error render_error(dp::String msg = "") noexcept {
            return Error(ErrorCode::RenderError, std::move(msg));
        }
        static Error invalid_mmsi(const dp::String &mmsi) noexcept {
            return Error(ErrorCode::InvalidArgument, "mmsi must be a 9-digit integer: " + mmsi);
        }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace aistrack
