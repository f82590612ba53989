#include <strongbox/schema/key/builder.hpp>
#include <strongbox/schema/key/ledger_keys.hpp>

#include <algorithm>
#include <iterator>

namespace strongbox::schema::key {

strongbox::schema::bytes_t make_config_key() {
  return builder{}.write(kConfigKey).data;
}

strongbox::schema::bytes_t make_admin_key() {
  return builder{}.write(kAdminKey).data;
}

strongbox::schema::bytes_t make_totals_key() {
  return builder{}.write(kTotalsKey).data;
}

strongbox::schema::bytes_t make_account_key(
    const strongbox::schema::address_t& account) {
  return builder{}.write(kAccountKeyPrefix).write(account).data;
}

strongbox::schema::bytes_t make_account_prefix() {
  return builder{}.write(kAccountKeyPrefix).data;
}

std::optional<strongbox::schema::address_t> parse_account_key(
    const strongbox::schema::bytes_view_t& key) {
  auto account = strongbox::schema::address_t{};
  if (key.size() != kAccountKeyPrefix.size() + account.size()) {
    return std::nullopt;
  }
  if (!std::equal(std::begin(kAccountKeyPrefix), std::end(kAccountKeyPrefix),
                  std::begin(key),
                  [](const char lhs, const uint8_t rhs) {
                    return static_cast<uint8_t>(lhs) == rhs;
                  })) {
    return std::nullopt;
  }
  std::copy_n(std::begin(key) + kAccountKeyPrefix.size(), account.size(),
              std::begin(account));
  return account;
}

strongbox::schema::bytes_t make_history_key(
    const strongbox::schema::address_t& account,
    const strongbox::schema::operation_kind_t kind,
    const uint64_t index) {
  return builder{}
      .write(kHistoryKeyPrefix)
      .write(account)
      .write(kind)
      .write(index)
      .data;
}

strongbox::schema::bytes_t make_history_prefix(
    const strongbox::schema::address_t& account) {
  return builder{}.write(kHistoryKeyPrefix).write(account).data;
}

}  // namespace strongbox::schema::key
