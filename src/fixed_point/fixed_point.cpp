/// @file src/fixed_point/fixed_point.cpp
/// @brief Implementation of FixedPoint: checked arithmetic and rpow.
///
/// Overflow detection widens every product to 512 bits and checks the upper
/// half, so no operation here relies on wrap-around behaviour.

#include "demurrage/fixed_point.hpp"

#include <cctype>

namespace demurrage::fixed_point {

namespace {

/// True if `wide` does not fit in 256 bits.
[[nodiscard]] bool exceeds_amount(const WideAmount& wide) noexcept {
    return (wide >> 256) != 0;
}

}  // namespace

// ─── Checked primitives ───────────────────────────────────────────────────────

std::optional<Amount>
FixedPoint::checked_add(const Amount& a, const Amount& b) noexcept {
    const Amount sum = a + b;
    if (sum < a) return std::nullopt;  // wrapped
    return sum;
}

std::optional<Amount>
FixedPoint::checked_sub(const Amount& a, const Amount& b) noexcept {
    if (b > a) return std::nullopt;
    return Amount{a - b};
}

std::optional<Amount>
FixedPoint::checked_mul(const Amount& a, const Amount& b) noexcept {
    const WideAmount wide = WideAmount{a} * WideAmount{b};
    if (exceeds_amount(wide)) return std::nullopt;
    return static_cast<Amount>(wide);
}

std::optional<Amount>
FixedPoint::mul_div(const Amount& a, const Amount& b, const Amount& d) noexcept {
    if (d == 0) return std::nullopt;
    const WideAmount quotient = (WideAmount{a} * WideAmount{b}) / WideAmount{d};
    if (exceeds_amount(quotient)) return std::nullopt;
    return static_cast<Amount>(quotient);
}

// ─── rpow ─────────────────────────────────────────────────────────────────────

std::optional<Amount>
FixedPoint::rpow(const Amount& base, std::uint64_t exponent, const Amount& scale) noexcept {
    if (scale == 0) return std::nullopt;

    if (base == 0) {
        return exponent == 0 ? scale : Amount{0};
    }

    const Amount half = scale / 2;

    // z accumulates the result; x walks base^(2^k).
    Amount x = base;
    Amount z = (exponent % 2 != 0) ? base : scale;

    for (std::uint64_t n = exponent / 2; n != 0; n /= 2) {
        // x = round(x² / scale)
        const auto xx = checked_mul(x, x);
        if (!xx) return std::nullopt;
        const auto xx_round = checked_add(*xx, half);
        if (!xx_round) return std::nullopt;
        x = *xx_round / scale;

        if (n % 2 != 0) {
            // z = round(z·x / scale)
            const auto zx = checked_mul(z, x);
            if (!zx) return std::nullopt;
            const auto zx_round = checked_add(*zx, half);
            if (!zx_round) return std::nullopt;
            z = *zx_round / scale;
        }
    }

    return z;
}

std::optional<Amount> FixedPoint::pow10(unsigned decimals) noexcept {
    Amount value = 1;
    for (unsigned i = 0; i < decimals; ++i) {
        const auto next = checked_mul(value, Amount{10});
        if (!next) return std::nullopt;
        value = *next;
    }
    return value;
}

// ─── Text ─────────────────────────────────────────────────────────────────────

std::optional<Amount> FixedPoint::parse(std::string_view text) noexcept {
    const auto e_pos = text.find_first_of("eE");
    const std::string_view mantissa = text.substr(0, e_pos);
    if (mantissa.empty()) return std::nullopt;

    Amount value = 0;
    for (char c : mantissa) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        const auto shifted = checked_mul(value, Amount{10});
        if (!shifted) return std::nullopt;
        const auto next = checked_add(*shifted, Amount{static_cast<unsigned>(c - '0')});
        if (!next) return std::nullopt;
        value = *next;
    }

    if (e_pos == std::string_view::npos) return value;

    const std::string_view exp_text = text.substr(e_pos + 1);
    if (exp_text.empty() || exp_text.size() > 3) return std::nullopt;
    unsigned exponent = 0;
    for (char c : exp_text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        exponent = exponent * 10 + static_cast<unsigned>(c - '0');
    }

    const auto multiplier = pow10(exponent);
    if (!multiplier) return std::nullopt;
    return checked_mul(value, *multiplier);
}

std::string FixedPoint::to_string(const Amount& value) {
    return value.str();
}

std::string FixedPoint::format_scaled(const Amount& value, unsigned decimals) {
    std::string digits = value.str();
    if (decimals == 0) return digits;

    if (digits.size() <= decimals) {
        digits.insert(0, decimals + 1 - digits.size(), '0');
    }

    const std::size_t split = digits.size() - decimals;
    std::string fraction = digits.substr(split);
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }

    std::string result = digits.substr(0, split);
    if (!fraction.empty()) {
        result += '.';
        result += fraction;
    }
    return result;
}

}  // namespace demurrage::fixed_point
