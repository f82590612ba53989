#include <spdlog/spdlog.h>
#include <strongbox/transfer/value_transfer_gateway.hpp>

#include <exception>
#include <utility>

namespace strongbox::transfer {

value_transfer_gateway::value_transfer_gateway(transfer_handler_t handler)
    : handler_{std::move(handler)} {}

void value_transfer_gateway::set_handler(transfer_handler_t handler) {
  handler_ = std::move(handler);
}

transfer_receipt_t value_transfer_gateway::send(
    const strongbox::schema::address_t& to,
    const strongbox::schema::amount_t& amount) {
  auto receipt = transfer_receipt_t{};
  if (!handler_) {
    receipt.reason = "no transfer handler installed";
  } else {
    try {
      receipt = handler_(to, amount);
    } catch (const std::exception& ex) {
      receipt = transfer_receipt_t{.success = false, .reason = ex.what()};
    }
  }

  if (receipt.success) {
    ++sent_count_;
    spdlog::debug("Sent {} to {}", amount.str(),
                  strongbox::schema::to_string(to));
  } else {
    ++failed_count_;
    if (receipt.reason.empty()) {
      receipt.reason = "recipient rejected transfer";
    }
    spdlog::warn("Transfer of {} to {} failed: {}", amount.str(),
                 strongbox::schema::to_string(to), receipt.reason);
  }
  return receipt;
}

}  // namespace strongbox::transfer
