#pragma once

/// @file include/demurrage/fixed_point.hpp
/// @brief Checked 256-bit arithmetic and the fixed-point power primitive.
///
/// # Module: Fixed Point
///
/// ## Responsibility
/// Provide the integer arithmetic the decay engine is built on:
///   - overflow-checked add / sub / mul on `Amount`
///   - `mul_div` with a 512-bit intermediate product
///   - `rpow(base, n, scale)` = (base/scale)^n · scale by repeated squaring
///
/// ## Rounding
/// `rpow` rounds half up at *every* multiplication step, not only at the
/// end: each product gets `scale/2` added before the truncating division.
/// This bounds the compounding error to about one unit per squaring.
///
/// ## Guarantees
/// - All functions are noexcept
/// - Overflow never wraps silently; it yields `std::nullopt`
/// - Pure functions of their inputs, safe to call concurrently
///
/// ## NOT Responsible For
/// - Deciding which rate applies to which span (see decay.hpp)
/// - Raising `ArithmeticOverflow` (the stateful layer does that)

#include "demurrage/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace demurrage::fixed_point {

/// Static utility class for checked fixed-point integer math.
class FixedPoint {
public:
    FixedPoint() = delete; // pure static

    // ── Checked primitives ────────────────────────────────────────────────────

    /// a + b, or `nullopt` if the sum exceeds 2^256 − 1.
    [[nodiscard]] static std::optional<Amount>
    checked_add(const Amount& a, const Amount& b) noexcept;

    /// a − b, or `nullopt` if b > a.
    [[nodiscard]] static std::optional<Amount>
    checked_sub(const Amount& a, const Amount& b) noexcept;

    /// a · b, or `nullopt` if the product exceeds 2^256 − 1.
    [[nodiscard]] static std::optional<Amount>
    checked_mul(const Amount& a, const Amount& b) noexcept;

    /// floor(a · b / d) computed with a 512-bit intermediate.
    ///
    /// # Returns
    /// `nullopt` if d = 0 or the quotient does not fit in 256 bits.
    [[nodiscard]] static std::optional<Amount>
    mul_div(const Amount& a, const Amount& b, const Amount& d) noexcept;

    // ── Power ─────────────────────────────────────────────────────────────────

    /// Fixed-point exponentiation: (base/scale)^exponent · scale.
    ///
    /// # Algorithm
    /// Square-and-multiply over the bits of `exponent`. Each product p is
    /// reduced as (p + scale/2) / scale.
    ///
    /// # Edge cases
    /// - rpow(0, 0, s) = s
    /// - rpow(0, n > 0, s) = 0
    /// - rpow(x, 0, s) = s
    /// - rpow(99000, 3, 100000) = 97030
    ///
    /// # Returns
    /// `nullopt` if scale = 0 or any intermediate product or rounding
    /// addition overflows 256 bits.
    [[nodiscard]] static std::optional<Amount>
    rpow(const Amount& base, std::uint64_t exponent, const Amount& scale) noexcept;

    /// 10^decimals, or `nullopt` if it does not fit in 256 bits.
    [[nodiscard]] static std::optional<Amount>
    pow10(unsigned decimals) noexcept;

    // ── Text ──────────────────────────────────────────────────────────────────

    /// Parse a non-empty string of decimal digits.
    ///
    /// Accepts an optional scientific suffix `eN` (e.g. "9985e21") so that
    /// 25-decimal rates stay readable on the command line.
    ///
    /// # Returns
    /// `nullopt` on empty input, any non-digit character, or overflow.
    [[nodiscard]] static std::optional<Amount>
    parse(std::string_view text) noexcept;

    /// Decimal representation of `value`.
    [[nodiscard]] static std::string to_string(const Amount& value);

    /// `value` rendered as a fixed-point number with `decimals` fraction
    /// digits, e.g. format_scaled(9985·10^21, 25) = "0.9985".
    /// Trailing zeros of the fraction are dropped.
    [[nodiscard]] static std::string
    format_scaled(const Amount& value, unsigned decimals);
};

} // namespace demurrage::fixed_point
