#pragma once

/// @file include/demurrage/authority.hpp
/// @brief Single-owner authorization for gated ledger operations.
///
/// Minting and rate-schedule changes are reserved to the owner. The check
/// runs before any state is read for the operation, so a rejected call has
/// no side effects.

#include "demurrage/types.hpp"

#include <string_view>

namespace demurrage {

class OwnerAuthority {
public:
    /// # Throws
    /// `InvalidAccount` if `owner` is empty.
    explicit OwnerAuthority(AccountId owner);

    /// # Throws
    /// `Unauthorized` unless `caller` is the owner. `action` names the
    /// rejected operation in the message.
    void require_owner(const AccountId& caller, std::string_view action) const;

    /// Hand the owner role to `new_owner`.
    /// # Throws
    /// `Unauthorized` (caller is not the owner) or `InvalidAccount`
    /// (empty new owner).
    void transfer_ownership(const AccountId& caller, AccountId new_owner);

    [[nodiscard]] const AccountId& owner() const noexcept { return owner_; }

private:
    AccountId owner_;
};

} // namespace demurrage
