/// @file src/token/token.cpp
/// @brief DemurrageToken: settle, validate, commit.
///
/// Every mutating operation follows the same three steps:
///   1. settle decay for each touched subject (no writes)
///   2. validate the ledger rule against the decayed values
///   3. commit raw values + checkpoints, then emit events
/// Any throw happens in steps 1–2, before the first write.

#include "demurrage/token.hpp"
#include "demurrage/errors.hpp"

#include <stdexcept>

namespace demurrage {

using fixed_point::FixedPoint;

namespace {

/// Entry 0 of the schedule: the configured rate or SCALE (1.0).
/// Rejects a rate precision rpow cannot square in 256 bits.
Rate resolve_initial_rate(const TokenConfig& config) {
    if (config.rate_decimals == 0 || config.rate_decimals > constants::MAX_RATE_DECIMALS) {
        throw std::invalid_argument(fmt::format(
            "rate decimals {} outside [1, {}]",
            config.rate_decimals, constants::MAX_RATE_DECIMALS));
    }
    if (config.initial_rate) return *config.initial_rate;
    return *FixedPoint::pow10(config.rate_decimals);
}

std::string amount_str(const Amount& value) {
    return FixedPoint::to_string(value);
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

DemurrageToken::DemurrageToken(TokenConfig config, TimeSource now)
    : config_(std::move(config))
    , now_(std::move(now))
    , schedule_(PeriodClock(config_.genesis_timestamp, config_.period_duration_seconds),
                resolve_initial_rate(config_))
    , accountant_(schedule_, config_.rate_decimals)
    , authority_(config_.owner)
{
    if (!now_) {
        throw std::invalid_argument("time source must be set");
    }
    const Timestamp created_at = now_();
    if (config_.genesis_timestamp > created_at) {
        throw std::invalid_argument(fmt::format(
            "genesis timestamp {} lies after construction time {}",
            config_.genesis_timestamp, created_at));
    }
    trace("{} ({}) created: rate {} per {}s period, genesis {}",
          config_.name, config_.symbol,
          FixedPoint::format_scaled(schedule_.at(0).rate, config_.rate_decimals),
          config_.period_duration_seconds, config_.genesis_timestamp);
}

// ─── Time ─────────────────────────────────────────────────────────────────────

Period DemurrageToken::current_period() const {
    return schedule_.clock().period_of(now_());
}

Period DemurrageToken::period_of(Timestamp timestamp) const noexcept {
    return schedule_.clock().period_of(timestamp);
}

Timestamp DemurrageToken::start_timestamp(Period period) const {
    const auto start = schedule_.clock().start_of(period);
    if (!start) {
        throw ArithmeticOverflow(fmt::format("start of period {} is not representable", period));
    }
    return *start;
}

// ─── Rate schedule ────────────────────────────────────────────────────────────

const RateChange& DemurrageToken::rate_change_at(std::size_t index) const {
    return schedule_.at(index);
}

std::size_t DemurrageToken::schedule_count() const noexcept {
    return schedule_.count();
}

ScheduleChangeEvent
DemurrageToken::schedule_change(const AccountId& caller, Period period, const Rate& rate) {
    authority_.require_owner(caller, "schedule a rate change");
    try {
        auto event = schedule_.schedule_change(period, rate, now_());
        trace("rate {} scheduled for period {} (effective at {})",
              FixedPoint::format_scaled(rate, config_.rate_decimals),
              period, event.effective_timestamp);
        return event;
    } catch (const InvalidSchedule& e) {
        trace("rejected schedule change: {}", e.what());
        throw;
    }
}

// ─── Decayed reads ────────────────────────────────────────────────────────────

Amount DemurrageToken::balance_of(const AccountId& account) const {
    return accountant_.query(store_, Subject::of_account(account), current_period());
}

Amount DemurrageToken::total_supply() const {
    return accountant_.query(store_, Subject::total_supply(), current_period());
}

Amount DemurrageToken::allowance(const AccountId& owner, const AccountId& spender) const {
    return store_.get_allowance(owner, spender);
}

// ─── Validation helpers ───────────────────────────────────────────────────────

void DemurrageToken::require_account(const AccountId& account, std::string_view role) {
    if (account.empty()) {
        throw InvalidAccount(fmt::format("{} account must not be empty", role));
    }
}

void DemurrageToken::require_destination(const AccountId& account) {
    require_account(account, "destination");
    if (account == constants::NULL_ACCOUNT) {
        throw InvalidAccount("cannot transfer to the null account");
    }
}

void DemurrageToken::commit(const Subject& subject, const DecayResult& entry) {
    store_.set_raw(subject, entry.value);
    store_.set_state(subject, entry.state);
}

// ─── Transfers ────────────────────────────────────────────────────────────────

void DemurrageToken::move_balance(const AccountId& from, const AccountId& to, const Amount& amount) {
    const Period  now_period = current_period();
    const Subject source     = Subject::of_account(from);
    const Subject target     = Subject::of_account(to);

    DecayResult source_entry = accountant_.settle(store_, source, now_period);
    if (source_entry.value < amount) {
        throw InsufficientBalance(fmt::format(
            "{} holds {} but {} was requested",
            from, amount_str(source_entry.value), amount_str(amount)));
    }

    if (from == to) {
        commit(source, source_entry);
    } else {
        DecayResult target_entry = accountant_.settle(store_, target, now_period);
        const auto credited = FixedPoint::checked_add(target_entry.value, amount);
        if (!credited) {
            throw ArithmeticOverflow(fmt::format("balance of {} would overflow", to));
        }
        source_entry.value -= amount;
        target_entry.value  = *credited;

        commit(source, source_entry);
        commit(target, target_entry);
    }

    if (transfer_listener_) {
        transfer_listener_(TransferEvent{.from = from, .to = to, .value = amount});
    }
}

void DemurrageToken::transfer(const AccountId& caller, const AccountId& to, const Amount& amount) {
    require_account(caller, "sender");
    require_destination(to);
    move_balance(caller, to, amount);
}

void DemurrageToken::transfer_from(const AccountId& caller, const AccountId& from,
                                   const AccountId& to, const Amount& amount) {
    require_account(caller, "spender");
    require_account(from, "sender");
    require_destination(to);

    const Amount allowed = store_.get_allowance(from, caller);
    if (allowed < amount) {
        throw InsufficientAllowance(fmt::format(
            "{} may spend {} of {}'s balance but {} was requested",
            caller, amount_str(allowed), from, amount_str(amount)));
    }

    move_balance(from, to, amount);
    write_allowance(from, caller, allowed - amount);
}

// ─── Allowances ───────────────────────────────────────────────────────────────

void DemurrageToken::write_allowance(const AccountId& owner, const AccountId& spender, const Amount& value) {
    store_.set_allowance(owner, spender, value);
    if (approval_listener_) {
        approval_listener_(ApprovalEvent{.owner = owner, .spender = spender, .value = value});
    }
}

void DemurrageToken::approve(const AccountId& caller, const AccountId& spender, const Amount& amount) {
    require_account(caller, "owner");
    require_destination(spender);
    write_allowance(caller, spender, amount);
}

void DemurrageToken::increase_allowance(const AccountId& caller, const AccountId& spender, const Amount& added) {
    require_account(caller, "owner");
    require_destination(spender);
    const auto raised = FixedPoint::checked_add(store_.get_allowance(caller, spender), added);
    if (!raised) {
        throw ArithmeticOverflow(fmt::format("allowance of {} for {} would overflow", spender, caller));
    }
    write_allowance(caller, spender, *raised);
}

void DemurrageToken::decrease_allowance(const AccountId& caller, const AccountId& spender, const Amount& subtracted) {
    require_account(caller, "owner");
    require_destination(spender);
    const Amount current = store_.get_allowance(caller, spender);
    const auto lowered = FixedPoint::checked_sub(current, subtracted);
    if (!lowered) {
        throw InsufficientAllowance(fmt::format(
            "allowance of {} for {} is {}, cannot decrease by {}",
            spender, caller, amount_str(current), amount_str(subtracted)));
    }
    write_allowance(caller, spender, *lowered);
}

// ─── Supply ───────────────────────────────────────────────────────────────────

void DemurrageToken::mint(const AccountId& caller, const AccountId& to, const Amount& amount) {
    authority_.require_owner(caller, "mint");
    require_destination(to);

    const Period  now_period = current_period();
    const Subject account    = Subject::of_account(to);
    const Subject supply     = Subject::total_supply();

    DecayResult account_entry = accountant_.settle(store_, account, now_period);
    DecayResult supply_entry  = accountant_.settle(store_, supply, now_period);

    const auto new_balance = FixedPoint::checked_add(account_entry.value, amount);
    const auto new_supply  = FixedPoint::checked_add(supply_entry.value, amount);
    if (!new_balance || !new_supply) {
        throw ArithmeticOverflow(fmt::format("minting {} to {} would overflow", amount_str(amount), to));
    }
    account_entry.value = *new_balance;
    supply_entry.value  = *new_supply;

    commit(account, account_entry);
    commit(supply, supply_entry);
    trace("minted {} to {}", amount_str(amount), to);

    if (transfer_listener_) {
        transfer_listener_(TransferEvent{
            .from  = AccountId{constants::NULL_ACCOUNT},
            .to    = to,
            .value = amount,
        });
    }
}

void DemurrageToken::burn_balance(const AccountId& from, const Amount& amount) {
    const Period  now_period = current_period();
    const Subject account    = Subject::of_account(from);
    const Subject supply     = Subject::total_supply();

    DecayResult account_entry = accountant_.settle(store_, account, now_period);
    DecayResult supply_entry  = accountant_.settle(store_, supply, now_period);

    if (account_entry.value < amount) {
        throw InsufficientBalance(fmt::format(
            "{} holds {} but {} was to be burned",
            from, amount_str(account_entry.value), amount_str(amount)));
    }
    const auto new_supply = FixedPoint::checked_sub(supply_entry.value, amount);
    if (!new_supply) {
        throw ArithmeticOverflow(fmt::format(
            "burning {} would take the total supply {} below zero",
            amount_str(amount), amount_str(supply_entry.value)));
    }
    account_entry.value -= amount;
    supply_entry.value   = *new_supply;

    commit(account, account_entry);
    commit(supply, supply_entry);
    trace("burned {} from {}", amount_str(amount), from);

    if (transfer_listener_) {
        transfer_listener_(TransferEvent{
            .from  = from,
            .to    = AccountId{constants::NULL_ACCOUNT},
            .value = amount,
        });
    }
}

void DemurrageToken::burn(const AccountId& caller, const Amount& amount) {
    require_account(caller, "holder");
    burn_balance(caller, amount);
}

void DemurrageToken::burn_from(const AccountId& caller, const AccountId& from, const Amount& amount) {
    require_account(caller, "spender");
    require_account(from, "holder");

    const Amount allowed = store_.get_allowance(from, caller);
    if (allowed < amount) {
        throw InsufficientAllowance(fmt::format(
            "{} may burn {} of {}'s balance but {} was requested",
            caller, amount_str(allowed), from, amount_str(amount)));
    }

    burn_balance(from, amount);
    write_allowance(from, caller, allowed - amount);
}

// ─── Maintenance ──────────────────────────────────────────────────────────────

DecayResult DemurrageToken::persist_balance_decay(const AccountId& account) {
    require_account(account, "persisted");
    const Subject subject = Subject::of_account(account);
    const DecayState before = store_.get_state(subject);
    DecayResult result = accountant_.persist(store_, subject, current_period());
    if (result.state != before) {
        trace("persisted {}: {} through period {}",
              subject.describe(), amount_str(result.value), result.state.on_period);
    }
    return result;
}

DecayResult DemurrageToken::persist_total_supply_decay() {
    const Subject subject = Subject::total_supply();
    const DecayState before = store_.get_state(subject);
    DecayResult result = accountant_.persist(store_, subject, current_period());
    if (result.state != before) {
        trace("persisted {}: {} through period {}",
              subject.describe(), amount_str(result.value), result.state.on_period);
    }
    return result;
}

// ─── Fixed point ──────────────────────────────────────────────────────────────

Amount DemurrageToken::rpow(const Amount& base, std::uint64_t exponent, const Amount& scale) {
    const auto result = FixedPoint::rpow(base, exponent, scale);
    if (!result) {
        throw ArithmeticOverflow(fmt::format(
            "rpow({}, {}, {}) overflowed", amount_str(base), exponent, amount_str(scale)));
    }
    return *result;
}

// ─── Ownership & listeners ────────────────────────────────────────────────────

void DemurrageToken::transfer_ownership(const AccountId& caller, const AccountId& new_owner) {
    authority_.transfer_ownership(caller, new_owner);
    trace("ownership transferred from {} to {}", caller, new_owner);
}

void DemurrageToken::on_transfer(TransferListener listener) {
    transfer_listener_ = std::move(listener);
}

void DemurrageToken::on_approval(ApprovalListener listener) {
    approval_listener_ = std::move(listener);
}

void DemurrageToken::on_schedule_change(ScheduleChangeListener listener) {
    schedule_.set_listener(std::move(listener));
}

}  // namespace demurrage
