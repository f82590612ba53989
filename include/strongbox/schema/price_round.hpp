#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>

// Schema type: price round.
// Oracle workflow: one answer from the external price feed. decimals is the
// fixed-point precision of price (8 for the conventional USD feeds).
namespace strongbox::schema {

template <uint16_t Version>
struct price_round;

template <>
struct price_round<1> final {
  uint16_t version{1};
  price_t price{};
  uint8_t decimals{8};
};

using price_round_t = price_round<1>;

}  // namespace strongbox::schema
