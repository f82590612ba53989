#pragma once

#include <strongbox/schema/operation_kind.hpp>
#include <strongbox/schema/primitives.hpp>
#include <cstdint>

// Schema type: history entry.
// Ledger workflow: write-once record of one deposit or withdrawal amount,
// stored under the owning account. index is the global counter value for the
// entry's kind, so a single account sees gaps between its indices.
namespace strongbox::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  operation_kind_t kind{operation_kind_t::deposit};
  uint64_t index{};
  amount_t amount{};
};

using history_entry_t = history_entry<1>;

}  // namespace strongbox::schema
