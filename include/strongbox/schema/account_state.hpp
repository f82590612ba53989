#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>

// Schema type: account state.
// Ledger workflow: per-holder balance row; absent rows read as zero.
namespace strongbox::schema {

template <uint16_t Version>
struct account_state;

template <>
struct account_state<1> final {
  uint16_t version{1};
  amount_t balance{};
};

using account_state_t = account_state<1>;

}  // namespace strongbox::schema
