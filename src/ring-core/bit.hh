#pragma once

#include <bit>

// =========================================================================================================
// Bit manipulation functions
// =========================================================================================================
//
// Power of two operations:
//   has_single_bit(value)                   - check if value is integral power of 2
//
// Bit counting:
//   count_trailing_zeroes(value)            - count consecutive 0 bits from least significant bit
//   popcount(value)                         - count number of 1 bits in unsigned integer
//
// These are what the node pool needs for its slab freemaps:
// the lowest free slot is count_trailing_zeroes(freemap), the free slot count is popcount(freemap).
//

namespace rc
{
/// Checks if a number is an integral power of 2
/// Usage:
///   rc::has_single_bit(64u);  // true
///   rc::has_single_bit(48u);  // false
using std::has_single_bit;

/// Counts the number of consecutive 0 bits, starting from the least significant bit
/// Usage:
///   auto count = rc::count_trailing_zeroes(u8(0b01011000));  // 3
///   auto count = rc::count_trailing_zeroes(u8(0));           // 8 (all bits are 0)
///   auto count = rc::count_trailing_zeroes(u8(1));           // 0
template <class T>
[[nodiscard]] constexpr int count_trailing_zeroes(T value) noexcept
{
    return std::countr_zero(value);
}

/// Counts the number of 1 bits in an unsigned integer
/// Usage:
///   auto count = rc::popcount(u8(0b10110010));  // 4
///   auto count = rc::popcount(u64(~0ull));      // 64
using std::popcount;
} // namespace rc
