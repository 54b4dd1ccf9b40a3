#pragma once

#include "demurrage/types.hpp"

#include <cstdint>
#include <string_view>

/// @file include/demurrage/constants.hpp
/// @brief Ledger-wide constants and configuration defaults.

namespace demurrage::constants {

// ─── Time ─────────────────────────────────────────────────────────────────────

static constexpr std::uint64_t SECONDS_PER_DAY = 86'400;

/// Default decay period: 30 days.
static constexpr std::uint64_t DEFAULT_PERIOD_DURATION = 30 * SECONDS_PER_DAY;

// ─── Fixed point ──────────────────────────────────────────────────────────────

/// Default precision of rate fixed-point values (SCALE = 10^25).
static constexpr unsigned DEFAULT_RATE_DECIMALS = 25;

/// rpow squares a rate near SCALE in 256 bits: (10^38)^2 + 10^38/2 fits,
/// (10^39)^2 does not.
static constexpr unsigned MAX_RATE_DECIMALS = 38;

/// Decimals of the token amount itself (1 token = 10^18 base units).
static constexpr unsigned DEFAULT_TOKEN_DECIMALS = 18;

// ─── Accounts ─────────────────────────────────────────────────────────────────

/// Counterparty reported in transfer events for mint (from) and burn (to).
/// Never a valid transfer destination.
inline constexpr std::string_view NULL_ACCOUNT =
    "0x0000000000000000000000000000000000000000";

} // namespace demurrage::constants
