#pragma once

#include <cstdint>

namespace strongbox::schema {

enum class error_code : uint32_t {
  capacity_exceeded = 1,
  limit_exceeded = 2,
  insufficient_funds = 3,
  transfer_failed = 4,
  reentrancy_detected = 5,
  not_authorized = 6,
  oracle_unavailable = 7,
};

}  // namespace strongbox::schema
