#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>

// Schema type: admin state.
// Ledger workflow: sole owner identity and the price feed handle it controls.
namespace strongbox::schema {

template <uint16_t Version>
struct admin_state;

template <>
struct admin_state<1> final {
  uint16_t version{1};
  address_t owner{};
  address_t oracle_address{};
};

using admin_state_t = admin_state<1>;

}  // namespace strongbox::schema
