#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>

// Schema type: audit result.
// Ledger workflow: full scan of account rows checked against the pool totals.
namespace strongbox::schema {

template <uint16_t Version>
struct audit_result;

template <>
struct audit_result<1> final {
  uint16_t version{1};
  uint64_t account_count{};
  integer_t balance_sum{};
  amount_t total_balance{};
  amount_t bank_cap{};
  bool balanced{};
  bool within_cap{};

  bool ok() const { return balanced && within_cap; }
};

using audit_result_t = audit_result<1>;

}  // namespace strongbox::schema
