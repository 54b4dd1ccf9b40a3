#pragma once

/// @file include/demurrage/period_clock.hpp
/// @brief Conversion between timestamps and decay periods.
///
///     period(ts)   = floor((ts − genesis) / duration)
///     start(p)     = genesis + p · duration
///
/// Both parameters are fixed at construction. Timestamps earlier than
/// genesis belong to period 0.

#include "demurrage/types.hpp"

#include <chrono>
#include <functional>
#include <optional>

namespace demurrage {

/// Source of "now" for the ledger. Injected so that replays and tests are
/// deterministic.
using TimeSource = std::function<Timestamp()>;

/// Current wall-clock time in Unix seconds.
[[nodiscard]] Timestamp system_clock_now();

/// Immutable genesis/duration pair.
class PeriodClock {
public:
    /// # Throws
    /// `std::invalid_argument` if `period_duration_seconds` is zero.
    PeriodClock(Timestamp genesis_timestamp, std::uint64_t period_duration_seconds);

    /// Period containing `timestamp`.
    [[nodiscard]] Period period_of(Timestamp timestamp) const noexcept;

    /// First second of `period`, or `nullopt` if it overflows 64 bits.
    [[nodiscard]] std::optional<Timestamp> start_of(Period period) const noexcept;

    [[nodiscard]] Timestamp genesis() const noexcept { return genesis_; }
    [[nodiscard]] std::uint64_t duration() const noexcept { return duration_; }

private:
    Timestamp     genesis_;
    std::uint64_t duration_;
};

} // namespace demurrage
