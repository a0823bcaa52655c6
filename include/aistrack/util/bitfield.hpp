#pragma once

#include "../core/types.hpp"
#include <type_traits>

namespace aistrack {
    namespace util {

        // ─── Bit-level access helpers ────────────────────────────────────────────────
        namespace bitfield {

            template <typename T>
            concept UnsignedInt = std::is_unsigned_v<T>;

            template <UnsignedInt T> constexpr bool get_bit(T value, u8 bit) noexcept {
                constexpr u8 bit_width = sizeof(T) * 8;
                if (bit >= bit_width) {
                    return false;
                }
                return (value >> bit) & 0x01;
            }

            template <UnsignedInt T> constexpr T set_bit(T value, u8 bit, bool on) noexcept {
                constexpr u8 bit_width = sizeof(T) * 8;
                if (bit >= bit_width) {
                    return value;
                }
                if (on)
                    return value | (static_cast<T>(1) << bit);
                return value & ~(static_cast<T>(1) << bit);
            }

            template <UnsignedInt T> constexpr u8 count_bits(T value) noexcept {
                u8 n = 0;
                while (value) {
                    n += static_cast<u8>(value & 0x01);
                    value >>= 1;
                }
                return n;
            }

        } // namespace bitfield

    } // namespace util
} // namespace aistrack
