#pragma once

#include <strongbox/schema/operation_kind.hpp>
#include <strongbox/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: ledger keys.
// Ledger workflow: canonical key prefixes and key codecs for configuration,
// administration, pool totals, account balances and per-account history.
namespace strongbox::schema::key {

inline constexpr std::string_view kConfigKey{"SB|CONFIG"};
inline constexpr std::string_view kAdminKey{"SB|ADMIN"};
inline constexpr std::string_view kTotalsKey{"SB|TOTALS"};
inline constexpr std::string_view kAccountKeyPrefix{"SB|ACCOUNT|"};
inline constexpr std::string_view kHistoryKeyPrefix{"SB|HISTORY|"};

strongbox::schema::bytes_t make_config_key();
strongbox::schema::bytes_t make_admin_key();
strongbox::schema::bytes_t make_totals_key();

strongbox::schema::bytes_t make_account_key(
    const strongbox::schema::address_t& account);
strongbox::schema::bytes_t make_account_prefix();
std::optional<strongbox::schema::address_t> parse_account_key(
    const strongbox::schema::bytes_view_t& key);

/// SB|HISTORY|<account><kind><index, big-endian u64>
strongbox::schema::bytes_t make_history_key(
    const strongbox::schema::address_t& account,
    strongbox::schema::operation_kind_t kind,
    uint64_t index);
strongbox::schema::bytes_t make_history_prefix(
    const strongbox::schema::address_t& account);

}  // namespace strongbox::schema::key
