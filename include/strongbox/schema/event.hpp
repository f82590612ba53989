#pragma once

#include <strongbox/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: event.
// Ledger workflow: notification emitted by a committed operation. Consumed by
// observers only; nothing inside the ledger reads events back.
namespace strongbox::schema {

template <uint16_t Version>
struct event_attribute;

template <>
struct event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using event_attribute_t = event_attribute<1>;

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute_t> attributes;
};

using event_t = event<1>;

inline constexpr auto kDepositEventType = std::string_view{"deposit"};
inline constexpr auto kWithdrawalEventType = std::string_view{"withdrawal"};
inline constexpr auto kOwnerChangedEventType =
    std::string_view{"owner_changed"};
inline constexpr auto kOracleUpdatedEventType =
    std::string_view{"oracle_updated"};

event_t make_deposit_event(const address_t& account,
                           const amount_t& amount,
                           const amount_t& new_balance);
event_t make_withdrawal_event(const address_t& account,
                              const amount_t& amount,
                              const amount_t& new_balance);
event_t make_owner_changed_event(const address_t& previous_owner,
                                 const address_t& new_owner);
event_t make_oracle_updated_event(const address_t& oracle_address);

/// Value of the first attribute named key, if present.
std::optional<std::string> find_attribute(const event_t& event,
                                          std::string_view key);

}  // namespace strongbox::schema
