#include <gtest/gtest.h>
#include "demurrage/decay.hpp"
#include "demurrage/errors.hpp"
#include "demurrage/fixed_point.hpp"

#include <limits>
#include <stdexcept>

using namespace demurrage;
using namespace demurrage::fixed_point;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static constexpr Timestamp     GENESIS  = 1'700'000'000;
static constexpr std::uint64_t DURATION = 2'592'000;  // 30 days

static const Amount SCALE{"10000000000000000000000000"};    // 10^25
static const Rate   RATE_0{"9985000000000000000000000"};    // 0.9985
static const Rate   RATE_1{"9900000000000000000000000"};    // 0.99
static const Amount BALANCE{"10000000000000000000000"};     // 10000 · 10^18

static Timestamp at_period(Period p) {
    return GENESIS + p * DURATION;
}

/// value · (rate/S)^n through the public primitives.
static Amount apply_rate(const Amount& value, const Rate& rate, std::uint64_t n) {
    const auto factor = FixedPoint::rpow(rate, n, SCALE);
    EXPECT_TRUE(factor.has_value());
    const auto out = FixedPoint::mul_div(value, *factor, SCALE);
    EXPECT_TRUE(out.has_value());
    return *out;
}

static Amount abs_diff(const Amount& a, const Amount& b) {
    return a > b ? Amount{a - b} : Amount{b - a};
}

class DecayAccountantTest : public ::testing::Test {
protected:
    RateSchedule    schedule{PeriodClock(GENESIS, DURATION), RATE_0};
    DecayAccountant accountant{schedule, 25};
    LedgerStore     store;
    Subject         alice = Subject::of_account("alice");
};

// ─── Construction ────────────────────────────────────────────────────────────

TEST_F(DecayAccountantTest, ScaleFromRateDecimals) {
    EXPECT_EQ(accountant.scale(), SCALE);
    EXPECT_EQ(accountant.rate_decimals(), 25u);
}

TEST_F(DecayAccountantTest, ZeroRateDecimals_Throws) {
    EXPECT_THROW(DecayAccountant(schedule, 0), std::invalid_argument);
}

TEST_F(DecayAccountantTest, TooManyRateDecimals_Throws) {
    EXPECT_THROW(DecayAccountant(schedule, 39), std::invalid_argument);
    EXPECT_THROW(DecayAccountant(schedule, 77), std::invalid_argument);
    EXPECT_NO_THROW(DecayAccountant(schedule, 38));
}

// ─── compute_decayed: single regime ──────────────────────────────────────────

TEST_F(DecayAccountantTest, SamePeriod_Unchanged) {
    const DecayState state{.on_period = 4, .on_change_index = 0};
    const auto result = accountant.compute_decayed(BALANCE, state, 4);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, BALANCE);
    EXPECT_EQ(result->state, state);
}

TEST_F(DecayAccountantTest, EarlierPeriod_Unchanged) {
    const DecayState state{.on_period = 4, .on_change_index = 0};
    const auto result = accountant.compute_decayed(BALANCE, state, 2);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, BALANCE);
    EXPECT_EQ(result->state, state);
}

TEST_F(DecayAccountantTest, OnePeriod_ExactRetention) {
    const auto result = accountant.compute_decayed(BALANCE, {}, 1);
    ASSERT_TRUE(result.has_value());
    // 10000 · 0.9985 = 9985
    EXPECT_EQ(result->value, Amount{"9985000000000000000000"});
    EXPECT_EQ(result->state, (DecayState{1, 0}));
}

TEST_F(DecayAccountantTest, ManyPeriods_MatchesRpow) {
    const auto result = accountant.compute_decayed(BALANCE, {}, 36);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, apply_rate(BALANCE, RATE_0, 36));
    EXPECT_EQ(result->state, (DecayState{36, 0}));
}

TEST_F(DecayAccountantTest, ZeroValue_AdvancesCheckpoint) {
    const auto result = accountant.compute_decayed(0, {}, 9);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, Amount{0});
    EXPECT_EQ(result->state, (DecayState{9, 0}));
}

TEST_F(DecayAccountantTest, UnitRate_NoDecay) {
    RateSchedule    flat{PeriodClock(GENESIS, DURATION), SCALE};
    DecayAccountant flat_accountant{flat, 25};
    const auto result = flat_accountant.compute_decayed(BALANCE, {}, 1000);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, BALANCE);
}

TEST_F(DecayAccountantTest, IndexPastSchedule_Nullopt) {
    EXPECT_FALSE(accountant.compute_decayed(BALANCE, DecayState{0, 1}, 5).has_value());
}

// ─── compute_decayed: regime boundaries ──────────────────────────────────────

TEST_F(DecayAccountantTest, ChangeInFuture_NotApplied) {
    schedule.schedule_change(10, RATE_1, at_period(0));
    const auto result = accountant.compute_decayed(BALANCE, {}, 6);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, apply_rate(BALANCE, RATE_0, 6));
    EXPECT_EQ(result->state, (DecayState{6, 0}));
}

TEST_F(DecayAccountantTest, ChangeAtNowPeriod_OldRateThroughNow) {
    schedule.schedule_change(3, RATE_1, at_period(0));
    const auto result = accountant.compute_decayed(BALANCE, {}, 3);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, apply_rate(BALANCE, RATE_0, 3));
    EXPECT_EQ(result->state, (DecayState{3, 0}));
}

TEST_F(DecayAccountantTest, TwoRegimes_EachRateOverItsOwnSpan) {
    schedule.schedule_change(3, RATE_1, at_period(0));
    const auto result = accountant.compute_decayed(BALANCE, {}, 5);
    ASSERT_TRUE(result.has_value());

    const Amount expected = apply_rate(apply_rate(BALANCE, RATE_0, 3), RATE_1, 2);
    EXPECT_EQ(result->value, expected);
    EXPECT_EQ(result->state, (DecayState{5, 1}));
}

TEST_F(DecayAccountantTest, ResumeFromBoundaryCheckpoint) {
    schedule.schedule_change(3, RATE_1, at_period(0));
    // Evaluated exactly at the boundary, then resumed one period later.
    const auto first = accountant.compute_decayed(BALANCE, {}, 3);
    ASSERT_TRUE(first.has_value());
    const auto second = accountant.compute_decayed(first->value, first->state, 4);
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(second->value, apply_rate(apply_rate(BALANCE, RATE_0, 3), RATE_1, 1));
    EXPECT_EQ(second->state, (DecayState{4, 1}));
}

TEST_F(DecayAccountantTest, ResumeFromLaterRegime_SkipsEarlierRates) {
    schedule.schedule_change(3, RATE_1, at_period(0));
    const auto result = accountant.compute_decayed(BALANCE, DecayState{4, 1}, 7);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, apply_rate(BALANCE, RATE_1, 3));
}

TEST_F(DecayAccountantTest, ThreeRegimes_WalksAll) {
    const Rate rate_2{"9500000000000000000000000"};
    schedule.schedule_change(2, RATE_1, at_period(0));
    schedule.schedule_change(5, rate_2, at_period(0));

    const auto result = accountant.compute_decayed(BALANCE, {}, 9);
    ASSERT_TRUE(result.has_value());

    Amount expected = apply_rate(BALANCE, RATE_0, 2);
    expected = apply_rate(expected, RATE_1, 3);
    expected = apply_rate(expected, rate_2, 4);
    EXPECT_EQ(result->value, expected);
    EXPECT_EQ(result->state, (DecayState{9, 2}));
}

TEST_F(DecayAccountantTest, SteppedEvaluation_CloseToSingleEvaluation) {
    schedule.schedule_change(6, RATE_1, at_period(0));
    const auto once = accountant.compute_decayed(BALANCE, {}, 20);
    ASSERT_TRUE(once.has_value());

    Amount     value = BALANCE;
    DecayState state{};
    for (Period p = 1; p <= 20; ++p) {
        const auto step = accountant.compute_decayed(value, state, p);
        ASSERT_TRUE(step.has_value());
        value = step->value;
        state = step->state;
    }
    EXPECT_EQ(state, once->state);
    EXPECT_LT(abs_diff(value, once->value), Amount{100});
}

// ─── Overflow ────────────────────────────────────────────────────────────────

TEST_F(DecayAccountantTest, GrowthOverflow_Nullopt) {
    RateSchedule    growth{PeriodClock(GENESIS, DURATION), SCALE * 2};
    DecayAccountant growth_accountant{growth, 25};
    const Amount max = std::numeric_limits<Amount>::max();
    EXPECT_FALSE(growth_accountant.compute_decayed(max, {}, 1).has_value());
}

TEST_F(DecayAccountantTest, GrowthOverflow_SettleThrows_PersistLeavesStore) {
    RateSchedule    growth{PeriodClock(GENESIS, DURATION), SCALE * 2};
    DecayAccountant growth_accountant{growth, 25};
    const Amount max = std::numeric_limits<Amount>::max();
    store.set_raw(alice, max);

    EXPECT_THROW((void)growth_accountant.settle(store, alice, 1), ArithmeticOverflow);
    EXPECT_THROW(growth_accountant.persist(store, alice, 1), ArithmeticOverflow);
    EXPECT_EQ(store.get_raw(alice), max);
    EXPECT_EQ(store.get_state(alice), DecayState{});
}

// ─── Store-facing operations ─────────────────────────────────────────────────

TEST_F(DecayAccountantTest, QueryDoesNotWrite) {
    store.set_raw(alice, BALANCE);
    const Amount seen = accountant.query(store, alice, 12);
    EXPECT_EQ(seen, apply_rate(BALANCE, RATE_0, 12));
    EXPECT_EQ(store.get_raw(alice), BALANCE);
    EXPECT_EQ(store.get_state(alice), DecayState{});
}

TEST_F(DecayAccountantTest, PersistWritesValueAndState) {
    store.set_raw(alice, BALANCE);
    const auto result = accountant.persist(store, alice, 12);
    EXPECT_EQ(store.get_raw(alice), result.value);
    EXPECT_EQ(store.get_state(alice), (DecayState{12, 0}));
    EXPECT_EQ(accountant.query(store, alice, 12), result.value);
}

TEST_F(DecayAccountantTest, PersistTwiceInOnePeriod_Idempotent) {
    store.set_raw(alice, BALANCE);
    const auto first  = accountant.persist(store, alice, 7);
    const auto second = accountant.persist(store, alice, 7);
    EXPECT_EQ(first.value, second.value);
    EXPECT_EQ(first.state, second.state);
    EXPECT_EQ(store.get_raw(alice), first.value);
}

TEST_F(DecayAccountantTest, UnsetSubject_ReadsZero) {
    EXPECT_EQ(accountant.query(store, Subject::of_account("nobody"), 50), Amount{0});
    EXPECT_EQ(accountant.query(store, Subject::total_supply(), 50), Amount{0});
}
