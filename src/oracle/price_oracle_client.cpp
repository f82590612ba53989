#include <spdlog/spdlog.h>
#include <strongbox/conversion/unit_converter.hpp>
#include <strongbox/oracle/price_oracle_client.hpp>

#include <exception>
#include <limits>
#include <utility>

namespace strongbox::oracle {

price_oracle_client::price_oracle_client(
    const strongbox::admin::admin_registry& registry,
    price_feed_t feed)
    : registry_{registry}, feed_{std::move(feed)} {}

void price_oracle_client::set_feed(price_feed_t feed) {
  feed_ = std::move(feed);
}

strongbox::schema::outcome_t<strongbox::schema::price_round_t>
price_oracle_client::latest_price() const {
  auto unavailable = [](std::string reason) {
    spdlog::warn("Price oracle unavailable: {}", reason);
    return strongbox::schema::outcome_t<strongbox::schema::price_round_t>{
        strongbox::schema::failure_t{
            strongbox::schema::oracle_unavailable{.reason = std::move(reason)}}};
  };

  if (!feed_) {
    return unavailable("no price feed installed");
  }

  auto oracle_address = registry_.oracle_address();
  auto round = std::optional<strongbox::schema::price_round_t>{};
  try {
    round = feed_(oracle_address);
  } catch (const std::exception& ex) {
    return unavailable(ex.what());
  }
  if (!round) {
    return unavailable("no answer from " +
                       strongbox::schema::to_string(oracle_address));
  }

  auto normalized = strongbox::conversion::rescale(
      strongbox::schema::integer_t{round->price}, round->decimals,
      kQuoteDecimals);
  using price_limits = std::numeric_limits<strongbox::schema::price_t>;
  if (normalized > strongbox::schema::integer_t{price_limits::max()} ||
      normalized < strongbox::schema::integer_t{price_limits::min()}) {
    return unavailable("price " + round->price.str() +
                       " does not fit at 8 decimals");
  }
  return strongbox::schema::price_round_t{
      .price = static_cast<strongbox::schema::price_t>(normalized),
      .decimals = kQuoteDecimals};
}

strongbox::schema::outcome_t<strongbox::schema::integer_t>
price_oracle_client::get_value_in_quote_currency(
    const strongbox::schema::integer_t& amount_minor) const {
  auto price = latest_price();
  if (auto* failure = std::get_if<strongbox::schema::failure_t>(&price)) {
    return *failure;
  }
  const auto& round = std::get<strongbox::schema::price_round_t>(price);
  return strongbox::schema::integer_t{
      amount_minor * strongbox::schema::integer_t{round.price} /
      strongbox::conversion::pow10(kQuoteDecimals)};
}

}  // namespace strongbox::oracle
