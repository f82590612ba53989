#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>

// Schema type: ledger config.
// Ledger workflow: construction-time limits. Written once when the database is
// first opened and never rewritten.
namespace strongbox::schema {

template <uint16_t Version>
struct ledger_config;

template <>
struct ledger_config<1> final {
  uint16_t version{1};
  amount_t withdraw_limit{};
  amount_t bank_cap{};
};

using ledger_config_t = ledger_config<1>;

}  // namespace strongbox::schema
