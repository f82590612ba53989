#include <algorithm>
#include <iterator>
#include <ranges>
#include <strongbox/schema/key/builder.hpp>

using namespace strongbox::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const strongbox::schema::address_t& address) {
  return write(std::span<const uint8_t>{address.data(), address.size()});
}

builder& builder::write(const strongbox::schema::operation_kind_t kind) {
  return write(static_cast<uint8_t>(kind));
}
