#include <strongbox/schema/event.hpp>

#include <algorithm>
#include <iterator>

namespace strongbox::schema {

namespace {

event_attribute_t make_attribute(std::string key,
                                 std::string value,
                                 const bool index = false) {
  return event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

}  // namespace

event_t make_deposit_event(const address_t& account,
                           const amount_t& amount,
                           const amount_t& new_balance) {
  return event_t{.type = std::string{kDepositEventType},
                 .attributes = {make_attribute("account", to_string(account),
                                               true),
                                make_attribute("amount", amount.str()),
                                make_attribute("new_balance",
                                               new_balance.str())}};
}

event_t make_withdrawal_event(const address_t& account,
                              const amount_t& amount,
                              const amount_t& new_balance) {
  return event_t{.type = std::string{kWithdrawalEventType},
                 .attributes = {make_attribute("account", to_string(account),
                                               true),
                                make_attribute("amount", amount.str()),
                                make_attribute("new_balance",
                                               new_balance.str())}};
}

event_t make_owner_changed_event(const address_t& previous_owner,
                                 const address_t& new_owner) {
  return event_t{
      .type = std::string{kOwnerChangedEventType},
      .attributes = {make_attribute("previous_owner",
                                    to_string(previous_owner), true),
                     make_attribute("new_owner", to_string(new_owner), true)}};
}

event_t make_oracle_updated_event(const address_t& oracle_address) {
  return event_t{.type = std::string{kOracleUpdatedEventType},
                 .attributes = {make_attribute(
                     "oracle_address", to_string(oracle_address), true)}};
}

std::optional<std::string> find_attribute(const event_t& event,
                                          const std::string_view key) {
  auto found = std::find_if(
      std::begin(event.attributes), std::end(event.attributes),
      [&](const event_attribute_t& attribute) { return attribute.key == key; });
  if (found == std::end(event.attributes)) {
    return std::nullopt;
  }
  return found->value;
}

}  // namespace strongbox::schema
