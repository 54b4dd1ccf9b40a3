/// @file src/decay/decay_accountant.cpp
/// @brief DecayAccountant: regime walk, settle, persist, query.

#include "demurrage/decay.hpp"
#include "demurrage/constants.hpp"
#include "demurrage/errors.hpp"
#include "demurrage/fixed_point.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace demurrage {

using fixed_point::FixedPoint;

// ─── Construction ─────────────────────────────────────────────────────────────

DecayAccountant::DecayAccountant(const RateSchedule& schedule, unsigned rate_decimals)
    : schedule_(schedule)
    , rate_decimals_(rate_decimals)
{
    if (rate_decimals_ == 0) {
        throw std::invalid_argument("rate decimals must be greater than zero");
    }
    if (rate_decimals_ > constants::MAX_RATE_DECIMALS) {
        throw std::invalid_argument(fmt::format(
            "rate decimals {} exceed the maximum of {}",
            rate_decimals_, constants::MAX_RATE_DECIMALS));
    }
    scale_ = *FixedPoint::pow10(rate_decimals_);
}

// ─── compute_decayed ──────────────────────────────────────────────────────────

std::optional<DecayResult>
DecayAccountant::compute_decayed(const Amount& raw, DecayState state, Period now_period) const noexcept {
    const auto& changes = schedule_.changes();
    if (state.on_change_index >= changes.size()) return std::nullopt;

    // Already evaluated through now (or a clock that went backwards):
    // never move the checkpoint or apply decay twice.
    if (now_period <= state.on_period) {
        return DecayResult{.value = raw, .state = state};
    }

    Amount      value = raw;
    Period      start = state.on_period;
    std::size_t i     = state.on_change_index;

    for (;;) {
        const bool closed = (i + 1 < changes.size())
                            && changes[i + 1].period < now_period;
        const Period end  = closed ? changes[i + 1].period : now_period;

        // Span [start, end) under rate r_i. Zero-length spans apply nothing.
        if (end > start && value != 0) {
            const auto factor = FixedPoint::rpow(changes[i].rate, end - start, scale_);
            if (!factor) return std::nullopt;
            const auto decayed = FixedPoint::mul_div(value, *factor, scale_);
            if (!decayed) return std::nullopt;
            value = *decayed;
        }

        if (!closed) {
            return DecayResult{
                .value = value,
                .state = DecayState{.on_period = end, .on_change_index = i},
            };
        }

        start = std::max(start, end);
        ++i;
    }
}

// ─── Store-facing operations ──────────────────────────────────────────────────

DecayResult
DecayAccountant::settle(const LedgerStore& store, const Subject& subject, Period now_period) const {
    const auto result = compute_decayed(store.get_raw(subject), store.get_state(subject), now_period);
    if (!result) {
        throw ArithmeticOverflow(fmt::format(
            "decay of {} through period {} overflowed", subject.describe(), now_period));
    }
    return *result;
}

DecayResult
DecayAccountant::persist(LedgerStore& store, const Subject& subject, Period now_period) const {
    DecayResult result = settle(store, subject, now_period);
    store.set_raw(subject, result.value);
    store.set_state(subject, result.state);
    return result;
}

Amount
DecayAccountant::query(const LedgerStore& store, const Subject& subject, Period now_period) const {
    return settle(store, subject, now_period).value;
}

}  // namespace demurrage
