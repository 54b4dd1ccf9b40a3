#pragma once

/// @file include/demurrage/ledger_store.hpp
/// @brief In-memory raw-value store consumed by the decay engine.
///
/// # Module: Ledger Store
///
/// ## Responsibility
/// Keep, per subject (an account or the aggregate supply), the raw
/// undecayed value and its `DecayState` checkpoint, plus the plain
/// allowance table of the token.
///
/// The values held here are *raw*: they equal the public value only right
/// after a persist. Public reads must go through `DecayAccountant`.
///
/// ## Guarantees
/// - Unset subjects read as raw 0 with checkpoint {0, 0}
/// - No validation: the store never rejects a write
///
/// ## NOT Responsible For
/// - Decay (see decay.hpp)
/// - Balance / allowance rules (see token.hpp)

#include "demurrage/types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>

namespace demurrage {

// ─── Subject ──────────────────────────────────────────────────────────────────

/// Something that owns a raw value and a checkpoint.
struct Subject {
    enum class Kind {
        Account,
        TotalSupply,
    };

    Kind      kind{Kind::Account};
    AccountId account;  ///< Empty for TotalSupply

    [[nodiscard]] static Subject of_account(AccountId id);
    [[nodiscard]] static Subject total_supply();

    /// "account <id>" or "total supply", for diagnostics.
    [[nodiscard]] std::string describe() const;

    bool operator==(const Subject&) const = default;
};

// ─── LedgerStore ──────────────────────────────────────────────────────────────

class LedgerStore {
public:
    [[nodiscard]] Amount get_raw(const Subject& subject) const;
    void set_raw(const Subject& subject, Amount value);

    [[nodiscard]] DecayState get_state(const Subject& subject) const;
    void set_state(const Subject& subject, DecayState state);

    [[nodiscard]] Amount get_allowance(const AccountId& owner, const AccountId& spender) const;
    void set_allowance(const AccountId& owner, const AccountId& spender, Amount value);

private:
    struct Entry {
        Amount     raw{0};
        DecayState state{};
    };

    [[nodiscard]] const Entry* find(const Subject& subject) const;
    Entry& slot(const Subject& subject);

    std::map<AccountId, Entry>                          accounts_;
    Entry                                               supply_;
    std::map<std::pair<AccountId, AccountId>, Amount>   allowances_;
};

} // namespace demurrage
