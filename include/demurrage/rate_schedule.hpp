#pragma once

/// @file include/demurrage/rate_schedule.hpp
/// @brief Append-only schedule of decay-rate changes.
///
/// # Module: Rate Schedule
///
/// ## Responsibility
/// Hold the ordered sequence of `RateChange` entries the decay engine walks
/// through. Entry 0 is created with the initial rate at period 0; later
/// entries are appended by `schedule_change`.
///
/// ## Invariants
/// - entries[0].period == 0
/// - entries[i].period < entries[i+1].period
/// - a new entry's period is strictly greater than the current period and
///   strictly greater than the last entry's period
/// - entries are never removed or modified
///
/// Once a rate is scheduled for a period it can only be superseded by a
/// change further in the future, never altered.
///
/// ## NOT Responsible For
/// - Authorization of the caller (checked by the token before calling in)
/// - Applying rates to values (see decay.hpp)

#include "demurrage/period_clock.hpp"
#include "demurrage/types.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace demurrage {

/// Notification emitted for every accepted schedule change.
struct ScheduleChangeEvent {
    Timestamp effective_timestamp; ///< genesis + period · duration
    Period    period;
    Rate      rate;

    bool operator==(const ScheduleChangeEvent&) const = default;
};

using ScheduleChangeListener = std::function<void(const ScheduleChangeEvent&)>;

class RateSchedule {
public:
    /// Create the schedule with `{0, initial_rate}` as its only entry.
    RateSchedule(PeriodClock clock, Rate initial_rate);

    /// Append `{change_period, change_rate}`.
    ///
    /// # Preconditions
    /// - change_period > clock.period_of(now)
    /// - change_period > last().period
    ///
    /// # Returns
    /// The emitted event (also delivered to the listener, if set).
    ///
    /// # Throws
    /// `InvalidSchedule` if a precondition is violated or the effective
    /// timestamp is not representable. The schedule is left unchanged.
    ScheduleChangeEvent schedule_change(Period change_period, const Rate& change_rate, Timestamp now);

    /// Entry at `index`.
    /// # Throws
    /// `std::out_of_range` if `index >= count()`.
    [[nodiscard]] const RateChange& at(std::size_t index) const;

    [[nodiscard]] std::size_t count() const noexcept { return changes_.size(); }
    [[nodiscard]] const RateChange& last() const noexcept { return changes_.back(); }
    [[nodiscard]] const std::vector<RateChange>& changes() const noexcept { return changes_; }
    [[nodiscard]] const PeriodClock& clock() const noexcept { return clock_; }

    /// Replace the listener that receives ScheduleChangeEvent.
    void set_listener(ScheduleChangeListener listener);

private:
    PeriodClock             clock_;
    std::vector<RateChange> changes_;
    ScheduleChangeListener  listener_;
};

} // namespace demurrage
