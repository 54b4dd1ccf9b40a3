#pragma once

/// @file include/demurrage/types.hpp
/// @brief Shared primitive types for the demurrage ledger.
///
/// Every module includes this file. It defines the wide-integer amount type,
/// the period/timestamp scalars and the two records the decay engine is
/// built on: `RateChange` (one schedule entry) and `DecayState` (one
/// per-subject checkpoint).

#include <boost/multiprecision/cpp_int.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace demurrage {

// ─── Scalars ──────────────────────────────────────────────────────────────────

/// Token amount in base units. 256 bits so that a balance of 10^22 units
/// multiplied by a 25-decimal rate still fits in intermediate products.
using Amount = boost::multiprecision::uint256_t;

/// Double-width integer used only to detect overflow of `Amount` products.
using WideAmount = boost::multiprecision::uint512_t;

/// Per-period retention factor scaled by 10^rate_decimals.
/// 0.9985 at 25 decimals is 9985 * 10^21.
using Rate = Amount;

/// Index of a fixed-duration bucket since genesis.
using Period = std::uint64_t;

/// Unix epoch seconds.
using Timestamp = std::uint64_t;

/// Opaque account identity (address string).
using AccountId = std::string;

// ─── RateChange ───────────────────────────────────────────────────────────────

/// One entry of the rate schedule: `rate` applies from `period` onwards
/// until the next entry takes over.
struct RateChange {
    Period period{0};
    Rate   rate{0};

    bool operator==(const RateChange&) const = default;
};

// ─── DecayState ───────────────────────────────────────────────────────────────

/// Checkpoint of a subject's raw value.
///
/// Decay has been folded into the raw value up to `on_period`; the regime to
/// resume from is schedule entry `on_change_index`. A subject that was never
/// touched owns the zero checkpoint `{0, 0}`.
struct DecayState {
    Period      on_period{0};
    std::size_t on_change_index{0};

    bool operator==(const DecayState&) const = default;
};

/// Result of folding decay into a raw value.
struct DecayResult {
    Amount     value;  ///< Decayed value as of the evaluated period
    DecayState state;  ///< Checkpoint matching `value`
};

} // namespace demurrage
