#pragma once

#include <strongbox/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: operation kind.
// Ledger workflow: which balance mutation produced a history entry or journal
// record.
namespace strongbox::schema {

enum class operation_kind_t : uint8_t { deposit = 0, withdrawal = 1 };

inline constexpr auto kOperationKindMappings =
    std::array{std::pair<std::string_view, operation_kind_t>{
                   "deposit", operation_kind_t::deposit},
               std::pair<std::string_view, operation_kind_t>{
                   "withdrawal", operation_kind_t::withdrawal}};

template <>
inline std::optional<operation_kind_t> try_from_string<operation_kind_t>(
    const std::string_view value) {
  return from_string(value, kOperationKindMappings);
}

inline constexpr std::string_view to_string(const operation_kind_t value) {
  return to_string(value, kOperationKindMappings).value_or("unknown");
}

}  // namespace strongbox::schema
