/// @file src/ledger/ledger_store.cpp
/// @brief LedgerStore: std::map backed raw values, checkpoints, allowances.

#include "demurrage/ledger_store.hpp"

#include <fmt/format.h>

namespace demurrage {

// ─── Subject ──────────────────────────────────────────────────────────────────

Subject Subject::of_account(AccountId id) {
    return Subject{.kind = Kind::Account, .account = std::move(id)};
}

Subject Subject::total_supply() {
    return Subject{.kind = Kind::TotalSupply, .account = {}};
}

std::string Subject::describe() const {
    if (kind == Kind::TotalSupply) return "total supply";
    return fmt::format("account {}", account);
}

// ─── LedgerStore ──────────────────────────────────────────────────────────────

const LedgerStore::Entry* LedgerStore::find(const Subject& subject) const {
    if (subject.kind == Subject::Kind::TotalSupply) return &supply_;
    const auto it = accounts_.find(subject.account);
    return it == accounts_.end() ? nullptr : &it->second;
}

LedgerStore::Entry& LedgerStore::slot(const Subject& subject) {
    if (subject.kind == Subject::Kind::TotalSupply) return supply_;
    return accounts_[subject.account];
}

Amount LedgerStore::get_raw(const Subject& subject) const {
    const Entry* entry = find(subject);
    return entry ? entry->raw : Amount{0};
}

void LedgerStore::set_raw(const Subject& subject, Amount value) {
    slot(subject).raw = std::move(value);
}

DecayState LedgerStore::get_state(const Subject& subject) const {
    const Entry* entry = find(subject);
    return entry ? entry->state : DecayState{};
}

void LedgerStore::set_state(const Subject& subject, DecayState state) {
    slot(subject).state = state;
}

Amount LedgerStore::get_allowance(const AccountId& owner, const AccountId& spender) const {
    const auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? Amount{0} : it->second;
}

void LedgerStore::set_allowance(const AccountId& owner, const AccountId& spender, Amount value) {
    allowances_[{owner, spender}] = std::move(value);
}

}  // namespace demurrage
