#pragma once

#include <strongbox/schema/event.hpp>
#include <strongbox/schema/failure.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace strongbox::schema {

/// Outcome envelope of a mutating operation. code is zero on success and the
/// numeric error_code of failure otherwise.
template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<event_t> events;
  std::optional<failure_t> failure;

  bool ok() const { return code == 0; }
};

using transaction_result_t = transaction_result<1>;

/// Build a failed result for failure under codespace.
transaction_result_t make_failed_result(failure_t failure,
                                        std::string codespace);

}  // namespace strongbox::schema
