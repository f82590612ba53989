#pragma once

#include <strongbox/admin/admin_registry.hpp>
#include <strongbox/schema/failure.hpp>
#include <strongbox/schema/price_round.hpp>
#include <strongbox/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <optional>

namespace strongbox::oracle {

/// Fixed-point precision of quote prices handed to callers.
inline constexpr uint8_t kQuoteDecimals = 8;

/// External price collaborator. Returns the latest round published at
/// oracle_address, or std::nullopt when it has no answer.
using price_feed_t = std::function<std::optional<strongbox::schema::price_round_t>(
    const strongbox::schema::address_t& oracle_address)>;

/// Adapter between the ledger and the external price feed. The feed is
/// always queried at the address currently held by the admin registry, so
/// repointing the oracle takes effect on the next query.
class price_oracle_client final {
 public:
  price_oracle_client(const strongbox::admin::admin_registry& registry,
                      price_feed_t feed);

  /// Latest price normalized to kQuoteDecimals, or oracle_unavailable.
  strongbox::schema::outcome_t<strongbox::schema::price_round_t> latest_price()
      const;

  /// amount_minor * price / 10^8, truncated toward zero.
  strongbox::schema::outcome_t<strongbox::schema::integer_t>
  get_value_in_quote_currency(
      const strongbox::schema::integer_t& amount_minor) const;

  void set_feed(price_feed_t feed);

 private:
  const strongbox::admin::admin_registry& registry_;
  price_feed_t feed_;
};

}  // namespace strongbox::oracle
