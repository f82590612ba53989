#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>

// Schema type: ledger totals.
// Ledger workflow: custody pool aggregate. total_balance always equals the sum
// of every account balance. The counters are global and their post-increment
// value is the history index of the write that bumped them.
namespace strongbox::schema {

template <uint16_t Version>
struct ledger_totals;

template <>
struct ledger_totals<1> final {
  uint16_t version{1};
  amount_t total_balance{};
  uint64_t deposit_count{};
  uint64_t withdrawal_count{};
};

using ledger_totals_t = ledger_totals<1>;

}  // namespace strongbox::schema
