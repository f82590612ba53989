#include <spdlog/fmt/fmt.h>
#include <strongbox/schema/failure.hpp>

namespace strongbox::schema {

error_code code_of(const failure_t& failure) {
  return std::visit(
      overloaded{
          [](const capacity_exceeded&) { return error_code::capacity_exceeded; },
          [](const limit_exceeded&) { return error_code::limit_exceeded; },
          [](const insufficient_funds&) {
            return error_code::insufficient_funds;
          },
          [](const transfer_failed&) { return error_code::transfer_failed; },
          [](const reentrancy_detected&) {
            return error_code::reentrancy_detected;
          },
          [](const not_authorized&) { return error_code::not_authorized; },
          [](const oracle_unavailable&) {
            return error_code::oracle_unavailable;
          }},
      failure);
}

std::string describe(const failure_t& failure) {
  return std::visit(
      overloaded{
          [](const capacity_exceeded& value) {
            return fmt::format("capacity exceeded: total {} above cap {}",
                               value.requested_total.str(),
                               value.bank_cap.str());
          },
          [](const limit_exceeded& value) {
            return fmt::format("limit exceeded: {} above withdraw limit {}",
                               value.requested.str(),
                               value.withdraw_limit.str());
          },
          [](const insufficient_funds& value) {
            return fmt::format("insufficient funds: {} requested {} holding {}",
                               to_string(value.account), value.requested.str(),
                               value.balance.str());
          },
          [](const transfer_failed& value) {
            return fmt::format("transfer failed: {}", value.reason);
          },
          [](const reentrancy_detected&) {
            return std::string{"reentrancy detected"};
          },
          [](const not_authorized& value) {
            return fmt::format("not authorized: {}", to_string(value.caller));
          },
          [](const oracle_unavailable& value) {
            return fmt::format("oracle unavailable: {}", value.reason);
          }},
      failure);
}

}  // namespace strongbox::schema
