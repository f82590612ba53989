#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strongbox::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;

/// Custodied value in minor units (wei-equivalent).
using amount_t = boost::multiprecision::uint256_t;
/// Price feed answer; feeds are allowed to report negative values.
using price_t = boost::multiprecision::int256_t;
/// Unbounded intermediate for rescaling and valuation arithmetic.
using integer_t = boost::multiprecision::cpp_int;

bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

hash32_t make_zero_hash();

/// Parse 40 hex digits (optional 0x prefix). Terminates on malformed input;
/// use try_make_address for untrusted text.
address_t make_address(const std::string_view& hex);
std::optional<address_t> try_make_address(const std::string_view& hex);

/// Parse a non-negative decimal string that fits in 256 bits.
std::optional<amount_t> try_make_amount(const std::string_view& decimal);

/// Lowercase hex without prefix.
std::string to_hex(const bytes_view_t& bytes);
/// 0x-prefixed lowercase hex.
std::string to_string(const address_t& address);

}  // namespace strongbox::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
