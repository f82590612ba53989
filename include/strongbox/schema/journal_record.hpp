#pragma once

#include <strongbox/schema/operation_kind.hpp>
#include <strongbox/schema/primitives.hpp>
#include <cstdint>

// Schema type: journal record.
// Ledger workflow: material folded into the state root for every committed
// top-level balance mutation.
namespace strongbox::schema {

template <uint16_t Version>
struct journal_record;

template <>
struct journal_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  operation_kind_t kind{operation_kind_t::deposit};
  address_t account{};
  amount_t amount{};
};

using journal_record_t = journal_record<1>;

}  // namespace strongbox::schema
