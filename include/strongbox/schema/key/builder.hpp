#pragma once
#include <strongbox/schema/operation_kind.hpp>
#include <strongbox/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace strongbox::schema::key {

/// Raw byte key assembler. Integers are written big-endian so that RocksDB's
/// bytewise ordering matches numeric ordering within a prefix.
struct builder final {
  strongbox::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const strongbox::schema::address_t& address);
  builder& write(const strongbox::schema::operation_kind_t kind);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = sizeof(T); i > 0; --i) {
      data.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace strongbox::schema::key
