/// @file src/schedule/rate_schedule.cpp
/// @brief RateSchedule: monotonic, future-only rate changes.

#include "demurrage/rate_schedule.hpp"
#include "demurrage/errors.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <utility>

namespace demurrage {

RateSchedule::RateSchedule(PeriodClock clock, Rate initial_rate)
    : clock_(clock)
{
    changes_.push_back(RateChange{.period = 0, .rate = std::move(initial_rate)});
}

ScheduleChangeEvent
RateSchedule::schedule_change(Period change_period, const Rate& change_rate, Timestamp now) {
    const Period current = clock_.period_of(now);
    if (change_period <= current) {
        throw InvalidSchedule(fmt::format(
            "rate change for period {} is not in the future (current period {})",
            change_period, current));
    }
    if (change_period <= last().period) {
        throw InvalidSchedule(fmt::format(
            "rate change for period {} does not follow the last scheduled change at period {}",
            change_period, last().period));
    }

    const auto effective = clock_.start_of(change_period);
    if (!effective) {
        throw InvalidSchedule(fmt::format(
            "period {} has no representable start timestamp", change_period));
    }

    changes_.push_back(RateChange{.period = change_period, .rate = change_rate});

    ScheduleChangeEvent event{
        .effective_timestamp = *effective,
        .period              = change_period,
        .rate                = change_rate,
    };
    if (listener_) {
        listener_(event);
    }
    return event;
}

const RateChange& RateSchedule::at(std::size_t index) const {
    if (index >= changes_.size()) {
        throw std::out_of_range(fmt::format(
            "rate change index {} out of range (count {})", index, changes_.size()));
    }
    return changes_[index];
}

void RateSchedule::set_listener(ScheduleChangeListener listener) {
    listener_ = std::move(listener);
}

}  // namespace demurrage
