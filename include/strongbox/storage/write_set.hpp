#pragma once
#include <strongbox/schema/primitives.hpp>
#include <strongbox/storage/storage.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <optional>
#include <vector>

namespace strongbox::storage {

/// Staged writes of one operation, layered over a parent write set or the
/// backing storage.
///
/// Reads see this set's own writes first, then each ancestor's, then storage.
/// Nothing reaches storage until the outermost set's entries are committed by
/// the owner; dropping a write set discards everything staged in it. A child
/// folds into its parent with merge_into_parent(), so an enclosing operation
/// that later fails also discards the work of operations nested inside it.
template <typename Storage>
class write_set final {
 public:
  explicit write_set(const Storage& storage, write_set* parent = nullptr)
      : storage_{storage}, parent_{parent} {}

  write_set(const write_set&) = delete;
  write_set& operator=(const write_set&) = delete;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const strongbox::schema::bytes_t& key) const {
    auto raw = find_raw(key);
    if (!raw) {
      return std::nullopt;
    }
    return {encoder.template decode<T>(
        strongbox::schema::bytes_view_t{raw->data(), raw->size()})};
  }

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const strongbox::schema::bytes_t& key,
           const T& value) {
    staged_[key] = encoder.encode(value);
  }

  /// Merged view of storage and every staged layer, in key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const strongbox::schema::bytes_view_t& prefix) const {
    auto merged = std::map<strongbox::schema::bytes_t,
                           strongbox::schema::bytes_t>{};
    for (auto& [key, value] : storage_.list_by_prefix(prefix)) {
      merged.emplace(std::move(key), std::move(value));
    }

    auto layers = std::vector<const write_set*>{};
    for (auto layer = this; layer != nullptr; layer = layer->parent_) {
      layers.push_back(layer);
    }
    for (auto it = std::rbegin(layers); it != std::rend(layers); ++it) {
      for (const auto& [key, value] : (*it)->staged_) {
        if (key.size() >= prefix.size() &&
            std::equal(std::begin(prefix), std::end(prefix),
                       std::begin(key))) {
          merged[key] = value;
        }
      }
    }

    auto entries = std::vector<key_value_entry_t>{};
    entries.reserve(merged.size());
    for (auto& [key, value] : merged) {
      entries.emplace_back(key, std::move(value));
    }
    return entries;
  }

  /// Staged writes of this layer only, in key order.
  std::vector<key_value_entry_t> entries() const {
    return std::vector<key_value_entry_t>(std::begin(staged_),
                                          std::end(staged_));
  }

  void merge_into_parent() {
    if (parent_ == nullptr) {
      return;
    }
    for (auto& [key, value] : staged_) {
      parent_->staged_[key] = std::move(value);
    }
    staged_.clear();
  }

  bool empty() const { return staged_.empty(); }

 private:
  std::optional<strongbox::schema::bytes_t> find_raw(
      const strongbox::schema::bytes_t& key) const {
    for (auto layer = this; layer != nullptr; layer = layer->parent_) {
      auto found = layer->staged_.find(key);
      if (found != std::end(layer->staged_)) {
        return found->second;
      }
    }
    return storage_.get_raw(
        strongbox::schema::bytes_view_t{key.data(), key.size()});
  }

  const Storage& storage_;
  write_set* parent_;
  std::map<strongbox::schema::bytes_t, strongbox::schema::bytes_t> staged_;
};

}  // namespace strongbox::storage
