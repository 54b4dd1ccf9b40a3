#pragma once

/// @file include/demurrage/token.hpp
/// @brief DemurrageToken: ERC20-style ledger on top of the decay engine.
///
/// # Module: Token
///
/// ## Responsibility
/// Compose the pieces into a usable ledger:
///   LedgerStore (raw values) → DecayAccountant (decayed view) →
///   DemurrageToken (balances, transfers, allowances, mint/burn, schedule)
///
/// Every mutating operation first settles decay for each subject it is
/// about to read-modify-write (sender, receiver, account, total supply),
/// validates against the decayed values, and only then commits raw values
/// and checkpoints together. Reads use the same computation and discard
/// the checkpoint.
///
/// ## Usage
/// ```cpp
/// TokenConfig cfg;
/// cfg.initial_rate      = *FixedPoint::parse("9985e21");  // 0.9985
/// cfg.genesis_timestamp = now;
/// cfg.owner             = "alice";
///
/// DemurrageToken token(cfg, clock);
/// token.mint("alice", "alice", amount);
/// token.transfer("alice", "bob", amount / 2);
/// ```
///
/// ## Guarantees
/// - All-or-nothing: a thrown `LedgerError` leaves store, schedule and
///   allowances exactly as they were, and emits no event
/// - Decay never emits a TransferEvent
/// - Allowances are plain amounts and do not decay
///
/// ## NOT Responsible For
/// - Persistence or networking
/// - Concurrency: callers serialize every mutating call

#include "demurrage/authority.hpp"
#include "demurrage/constants.hpp"
#include "demurrage/decay.hpp"
#include "demurrage/fixed_point.hpp"
#include "demurrage/ledger_store.hpp"
#include "demurrage/period_clock.hpp"
#include "demurrage/rate_schedule.hpp"
#include "demurrage/types.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace demurrage {

// ─── Configuration ────────────────────────────────────────────────────────────

/// Immutable token parameters.
struct TokenConfig {
    std::string name   = "Demurrage Token";
    std::string symbol = "DMR";

    /// Decimals of the token amount (display only).
    unsigned decimals = constants::DEFAULT_TOKEN_DECIMALS;

    /// Precision of rate fixed-point values: SCALE = 10^rate_decimals.
    unsigned rate_decimals = constants::DEFAULT_RATE_DECIMALS;

    /// Retention factor of schedule entry 0. `nullopt` means SCALE (no decay).
    std::optional<Rate> initial_rate;

    /// Start of period 0. Must not lie in the future at construction.
    Timestamp genesis_timestamp = 0;

    std::uint64_t period_duration_seconds = constants::DEFAULT_PERIOD_DURATION;

    /// Holder of the mint / schedule-change role.
    AccountId owner;

    /// If true, emit diagnostic lines to stderr.
    bool verbose = false;
};

// ─── Events ───────────────────────────────────────────────────────────────────

struct TransferEvent {
    AccountId from;   ///< NULL_ACCOUNT for mint
    AccountId to;     ///< NULL_ACCOUNT for burn
    Amount    value;

    bool operator==(const TransferEvent&) const = default;
};

struct ApprovalEvent {
    AccountId owner;
    AccountId spender;
    Amount    value;

    bool operator==(const ApprovalEvent&) const = default;
};

using TransferListener = std::function<void(const TransferEvent&)>;
using ApprovalListener = std::function<void(const ApprovalEvent&)>;

// ─── DemurrageToken ───────────────────────────────────────────────────────────

class DemurrageToken {
public:
    /// # Throws
    /// - `std::invalid_argument` for a zero period duration, rate decimals
    ///   of 0 or above MAX_RATE_DECIMALS, or a genesis in the future
    /// - `InvalidAccount` for an empty owner
    explicit DemurrageToken(TokenConfig config, TimeSource now = system_clock_now);

    // The accountant refers to the schedule member.
    DemurrageToken(const DemurrageToken&) = delete;
    DemurrageToken& operator=(const DemurrageToken&) = delete;

    // ── Metadata ──────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }
    [[nodiscard]] const std::string& symbol() const noexcept { return config_.symbol; }
    [[nodiscard]] unsigned decimals() const noexcept { return config_.decimals; }
    [[nodiscard]] unsigned rate_decimals() const noexcept { return config_.rate_decimals; }

    /// Raw ledger state (read-only).
    [[nodiscard]] const LedgerStore& store() const noexcept { return store_; }

    // ── Time ──────────────────────────────────────────────────────────────────

    [[nodiscard]] Period current_period() const;

    /// floor((timestamp − genesis) / duration); 0 before genesis.
    [[nodiscard]] Period period_of(Timestamp timestamp) const noexcept;

    /// genesis + period · duration.
    /// # Throws
    /// `ArithmeticOverflow` if not representable.
    [[nodiscard]] Timestamp start_timestamp(Period period) const;

    // ── Rate schedule ─────────────────────────────────────────────────────────

    /// # Throws
    /// `std::out_of_range` for an invalid index.
    [[nodiscard]] const RateChange& rate_change_at(std::size_t index) const;
    [[nodiscard]] std::size_t schedule_count() const noexcept;

    /// Owner-only. Appends a future rate change (see RateSchedule).
    /// # Throws
    /// `Unauthorized`, `InvalidSchedule`.
    ScheduleChangeEvent schedule_change(const AccountId& caller, Period period, const Rate& rate);

    // ── Decayed reads ─────────────────────────────────────────────────────────

    [[nodiscard]] Amount balance_of(const AccountId& account) const;
    [[nodiscard]] Amount total_supply() const;
    [[nodiscard]] Amount allowance(const AccountId& owner, const AccountId& spender) const;

    // ── Transfers & allowances ────────────────────────────────────────────────

    /// # Throws
    /// `InvalidAccount`, `InsufficientBalance`, `ArithmeticOverflow`.
    void transfer(const AccountId& caller, const AccountId& to, const Amount& amount);

    /// # Throws
    /// `InvalidAccount`.
    void approve(const AccountId& caller, const AccountId& spender, const Amount& amount);

    /// Move `amount` from `from` to `to` using `caller`'s allowance.
    /// # Throws
    /// `InvalidAccount`, `InsufficientAllowance`, `InsufficientBalance`,
    /// `ArithmeticOverflow`.
    void transfer_from(const AccountId& caller, const AccountId& from,
                       const AccountId& to, const Amount& amount);

    void increase_allowance(const AccountId& caller, const AccountId& spender, const Amount& added);
    void decrease_allowance(const AccountId& caller, const AccountId& spender, const Amount& subtracted);

    // ── Supply ────────────────────────────────────────────────────────────────

    /// Owner-only. Adds exactly `amount` to `to` and to the total supply
    /// after both have been persisted.
    void mint(const AccountId& caller, const AccountId& to, const Amount& amount);

    /// Destroys `amount` of the caller's decayed balance.
    void burn(const AccountId& caller, const Amount& amount);

    /// Destroys `amount` of `from`'s balance using `caller`'s allowance.
    void burn_from(const AccountId& caller, const AccountId& from, const Amount& amount);

    // ── Maintenance ───────────────────────────────────────────────────────────

    /// Fold outstanding decay into `account`'s raw balance. Callable by
    /// anyone; public balances do not change.
    DecayResult persist_balance_decay(const AccountId& account);

    /// Fold outstanding decay into the raw total supply.
    DecayResult persist_total_supply_decay();

    // ── Fixed point ───────────────────────────────────────────────────────────

    /// (base/scale)^exponent · scale, rounded half up at every step.
    /// # Throws
    /// `ArithmeticOverflow`.
    [[nodiscard]] static Amount rpow(const Amount& base, std::uint64_t exponent, const Amount& scale);

    // ── Ownership ─────────────────────────────────────────────────────────────

    [[nodiscard]] const AccountId& owner() const noexcept { return authority_.owner(); }
    void transfer_ownership(const AccountId& caller, const AccountId& new_owner);

    // ── Listeners ─────────────────────────────────────────────────────────────

    void on_transfer(TransferListener listener);
    void on_approval(ApprovalListener listener);
    void on_schedule_change(ScheduleChangeListener listener);

private:
    /// Rejects empty ids.
    static void require_account(const AccountId& account, std::string_view role);
    /// Rejects empty ids and the null account.
    static void require_destination(const AccountId& account);

    void move_balance(const AccountId& from, const AccountId& to, const Amount& amount);
    void burn_balance(const AccountId& from, const Amount& amount);
    void write_allowance(const AccountId& owner, const AccountId& spender, const Amount& value);
    void commit(const Subject& subject, const DecayResult& entry);

    template <typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) const {
        if (!config_.verbose) return;
        fmt::print(stderr, "[demurrage] {}\n", fmt::format(format, std::forward<Args>(args)...));
    }

    TokenConfig      config_;
    TimeSource       now_;
    RateSchedule     schedule_;
    DecayAccountant  accountant_;
    LedgerStore      store_;
    OwnerAuthority   authority_;
    TransferListener transfer_listener_;
    ApprovalListener approval_listener_;
};

} // namespace demurrage
