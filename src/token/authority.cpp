/// @file src/token/authority.cpp
/// @brief OwnerAuthority.

#include "demurrage/authority.hpp"
#include "demurrage/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace demurrage {

OwnerAuthority::OwnerAuthority(AccountId owner)
    : owner_(std::move(owner))
{
    if (owner_.empty()) {
        throw InvalidAccount("owner account must not be empty");
    }
}

void OwnerAuthority::require_owner(const AccountId& caller, std::string_view action) const {
    if (caller != owner_) {
        throw Unauthorized(fmt::format("{} is not permitted to {}", caller, action));
    }
}

void OwnerAuthority::transfer_ownership(const AccountId& caller, AccountId new_owner) {
    require_owner(caller, "transfer ownership");
    if (new_owner.empty()) {
        throw InvalidAccount("new owner account must not be empty");
    }
    owner_ = std::move(new_owner);
}

}  // namespace demurrage
