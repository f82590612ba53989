#pragma once

#include <strongbox/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace strongbox::transfer {

struct transfer_receipt_t final {
  bool success{};
  std::string reason;
};

/// Moves value out of custody. Implementations report failure through the
/// receipt; a thrown std::exception is converted into a failed receipt.
/// The handler may call back into the ledger (the recipient reacting to the
/// payment), so it must be treated as untrusted code.
using transfer_handler_t =
    std::function<transfer_receipt_t(const strongbox::schema::address_t& to,
                                     const strongbox::schema::amount_t& amount)>;

class value_transfer_gateway final {
 public:
  value_transfer_gateway() = default;
  explicit value_transfer_gateway(transfer_handler_t handler);

  /// Attempt an irreversible payment of amount to to.
  transfer_receipt_t send(const strongbox::schema::address_t& to,
                          const strongbox::schema::amount_t& amount);

  void set_handler(transfer_handler_t handler);

  uint64_t sent_count() const { return sent_count_; }
  uint64_t failed_count() const { return failed_count_; }

 private:
  transfer_handler_t handler_;
  uint64_t sent_count_{};
  uint64_t failed_count_{};
};

}  // namespace strongbox::transfer
