#pragma once

/// @file include/demurrage/errors.hpp
/// @brief Exception taxonomy for stateful ledger operations.
///
/// Pure math (rpow, checked arithmetic, decay computation) never throws; it
/// reports failure through `std::optional`. The stateful layer translates
/// those failures, and its own precondition violations, into the types
/// below. Every throw happens before the first write of the operation, so a
/// caught error always means "nothing changed".

#include <stdexcept>
#include <string>

namespace demurrage {

/// Base of every error raised by the ledger.
class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A schedule change targets the current or a past period, or does not come
/// strictly after the last scheduled change.
class InvalidSchedule : public LedgerError {
public:
    using LedgerError::LedgerError;
};

/// An intermediate value left the 256-bit range, or the aggregate supply
/// would drop below zero.
class ArithmeticOverflow : public LedgerError {
public:
    using LedgerError::LedgerError;
};

/// Raised by the owner authority when the caller may not perform a gated
/// operation.
class Unauthorized : public LedgerError {
public:
    using LedgerError::LedgerError;
};

/// Decayed balance is below the requested debit.
class InsufficientBalance : public LedgerError {
public:
    using LedgerError::LedgerError;
};

/// Spender's allowance is below the requested amount.
class InsufficientAllowance : public LedgerError {
public:
    using LedgerError::LedgerError;
};

/// Empty account id, or the null account used as a destination.
class InvalidAccount : public LedgerError {
public:
    using LedgerError::LedgerError;
};

} // namespace demurrage
