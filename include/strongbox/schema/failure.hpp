#pragma once

#include <strongbox/schema/error_code.hpp>
#include <strongbox/schema/primitives.hpp>

#include <string>
#include <variant>

// Schema type: failure.
// Ledger workflow: structured rejection data. Each alternative carries enough
// context to reconstruct the precondition that failed.
namespace strongbox::schema {

/// Deposit would push the pool above bank_cap. requested_total is the
/// unbounded sum so it is reported even when it would not fit in amount_t.
struct capacity_exceeded final {
  integer_t requested_total;
  amount_t bank_cap;
};

struct limit_exceeded final {
  amount_t requested;
  amount_t withdraw_limit;
};

struct insufficient_funds final {
  address_t account{};
  amount_t requested;
  amount_t balance;
};

/// Raised after effects were staged; the staged effects are discarded.
struct transfer_failed final {
  std::string reason;
};

struct reentrancy_detected final {};

struct not_authorized final {
  address_t caller{};
};

struct oracle_unavailable final {
  std::string reason;
};

using failure_t = std::variant<capacity_exceeded,
                               limit_exceeded,
                               insufficient_funds,
                               transfer_failed,
                               reentrancy_detected,
                               not_authorized,
                               oracle_unavailable>;

/// Either a value or the reason it could not be produced.
template <typename T>
using outcome_t = std::variant<T, failure_t>;

error_code code_of(const failure_t& failure);
std::string describe(const failure_t& failure);

}  // namespace strongbox::schema
