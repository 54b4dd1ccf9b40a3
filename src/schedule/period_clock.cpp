/// @file src/schedule/period_clock.cpp
/// @brief PeriodClock and the default system time source.

#include "demurrage/period_clock.hpp"

#include <limits>
#include <stdexcept>

namespace demurrage {

Timestamp system_clock_now() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

PeriodClock::PeriodClock(Timestamp genesis_timestamp, std::uint64_t period_duration_seconds)
    : genesis_(genesis_timestamp)
    , duration_(period_duration_seconds)
{
    if (duration_ == 0) {
        throw std::invalid_argument("period duration must be greater than zero");
    }
}

Period PeriodClock::period_of(Timestamp timestamp) const noexcept {
    if (timestamp < genesis_) return 0;
    return (timestamp - genesis_) / duration_;
}

std::optional<Timestamp> PeriodClock::start_of(Period period) const noexcept {
    constexpr auto max = std::numeric_limits<Timestamp>::max();
    if (period != 0 && duration_ > max / period) return std::nullopt;
    const Timestamp offset = period * duration_;
    if (offset > max - genesis_) return std::nullopt;
    return genesis_ + offset;
}

}  // namespace demurrage
