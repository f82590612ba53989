#pragma once
#include <strongbox/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace strongbox::storage {

using key_value_entry_t =
    std::pair<strongbox::schema::bytes_t, strongbox::schema::bytes_t>;

/// Head of the ledger journal: number of committed top-level mutations and
/// the state root folded over them.
struct committed_state final {
  uint64_t sequence{};
  strongbox::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const strongbox::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const strongbox::schema::bytes_view_t& key,
           const T& value) const;

  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<strongbox::schema::bytes_t> get_raw(
      const strongbox::schema::bytes_view_t& key) const;

  /// Load the journal head.
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const strongbox::schema::bytes_view_t& prefix) const;

  /// Atomically write entries together with the new journal head.
  void commit(const std::vector<key_value_entry_t>& entries,
              const std::optional<committed_state>& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace strongbox::storage
