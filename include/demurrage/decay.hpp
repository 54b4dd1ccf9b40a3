#pragma once

/// @file include/demurrage/decay.hpp
/// @brief Decay Accountant: lazy, checkpointed demurrage.
///
/// # Module: Decay Accountant
///
/// ## Responsibility
/// Turn a raw stored value plus its checkpoint into the value it has decayed
/// to by `now_period`, and produce the checkpoint that matches the result.
///
/// ## Algorithm
/// Starting at regime i = state.on_change_index and period
/// start = state.on_period, walk the schedule forward:
///
///     closed = (i + 1 < count) && schedule[i+1].period < now_period
///     end    = closed ? schedule[i+1].period : now_period
///     value  = value · rpow(r_i, end − start, SCALE) / SCALE
///
/// A closed regime advances (start = end, i += 1); the first open regime is
/// the last one applied and yields the checkpoint {end, i}.
///
/// Cost is one `rpow` (O(log periods)) per rate change since the checkpoint,
/// independent of how many periods elapsed.
///
/// ## Guarantees
/// - `compute_decayed` is pure and noexcept; failure is `nullopt`
/// - now_period == state.on_period returns the input unchanged
/// - A rate is only ever applied to periods in which it was in effect
/// - `persist` writes raw value and checkpoint together, or nothing
///
/// ## NOT Responsible For
/// - Ledger bookkeeping after decay is folded in (see token.hpp)
/// - Mapping wall-clock time to periods (see period_clock.hpp)

#include "demurrage/ledger_store.hpp"
#include "demurrage/rate_schedule.hpp"
#include "demurrage/types.hpp"

#include <optional>

namespace demurrage {

class DecayAccountant {
public:
    /// # Throws
    /// `std::invalid_argument` if 10^rate_decimals does not fit in 256 bits
    /// or rate_decimals is zero.
    DecayAccountant(const RateSchedule& schedule, unsigned rate_decimals);

    /// Fold decay into `raw` from `state` up to `now_period`.
    ///
    /// # Returns
    /// The decayed value and new checkpoint, or `nullopt` on arithmetic
    /// overflow or a checkpoint that points past the end of the schedule.
    [[nodiscard]] std::optional<DecayResult>
    compute_decayed(const Amount& raw, DecayState state, Period now_period) const noexcept;

    /// `compute_decayed` against the store, without writing.
    ///
    /// # Throws
    /// `ArithmeticOverflow` if the computation fails.
    [[nodiscard]] DecayResult
    settle(const LedgerStore& store, const Subject& subject, Period now_period) const;

    /// Settle and write back the decayed raw value and checkpoint.
    /// Calling it twice within one period changes nothing the second time.
    ///
    /// # Throws
    /// `ArithmeticOverflow`; the store is untouched in that case.
    DecayResult persist(LedgerStore& store, const Subject& subject, Period now_period) const;

    /// Decayed value of `subject`; the store is not modified.
    /// # Throws
    /// `ArithmeticOverflow`.
    [[nodiscard]] Amount
    query(const LedgerStore& store, const Subject& subject, Period now_period) const;

    /// 10^rate_decimals.
    [[nodiscard]] const Amount& scale() const noexcept { return scale_; }
    [[nodiscard]] unsigned rate_decimals() const noexcept { return rate_decimals_; }

private:
    const RateSchedule& schedule_;
    unsigned            rate_decimals_;
    Amount              scale_;
};

} // namespace demurrage
