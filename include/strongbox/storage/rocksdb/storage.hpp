#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <strongbox/common/critical.hpp>
#include <strongbox/schema/encoding/scale/encoder.hpp>
#include <strongbox/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>
#include <tuple>

namespace strongbox::storage {

namespace detail {

using encoder_t = strongbox::schema::encoding::encoder<
    strongbox::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const strongbox::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline strongbox::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const strongbox::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const strongbox::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<strongbox::schema::bytes_t> get_raw(
      const strongbox::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  std::vector<key_value_entry_t> list_by_prefix(
      const strongbox::schema::bytes_view_t& prefix) const;
  void commit(const std::vector<key_value_entry_t>& entries,
              const std::optional<committed_state>& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const strongbox::schema::bytes_view_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      strongbox::schema::bytes_view_t{raw->data(), raw->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const strongbox::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    strongbox::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(strongbox::schema::bytes_view_t{encoded_value.data(),
                                                       encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    strongbox::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<strongbox::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const strongbox::schema::bytes_view_t& key) const {
  if (!database) {
    strongbox::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    strongbox::common::critical("Failed to get value from RocksDB");
  }
  return strongbox::schema::bytes_t(std::begin(value), std::end(value));
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_raw(strongbox::schema::make_bytes_view(
      std::string_view{detail::kCommittedStateKey}));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, strongbox::schema::hash32_t>>(
          strongbox::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    strongbox::common::critical("failed to decode committed state");
  }
  return committed_state{.sequence = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const strongbox::schema::bytes_view_t& prefix) const {
  if (!database) {
    strongbox::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_slice);
  while (iterator->Valid()) {
    if (!iterator->key().starts_with(prefix_slice)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    strongbox::common::critical("RocksDB iteration failed");
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries,
    const std::optional<committed_state>& state) const {
  if (!database) {
    strongbox::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(
        detail::to_slice(strongbox::schema::bytes_view_t{key.data(),
                                                         key.size()}),
        detail::to_slice(strongbox::schema::bytes_view_t{value.data(),
                                                         value.size()}));
    if (!put_status.ok()) {
      strongbox::common::critical("failed staging key in write batch");
    }
  }

  if (state) {
    auto encoder = detail::encoder_t{};
    auto encoded = encoder.encode(std::tuple{state->sequence, state->state_root});
    auto state_status = batch.Put(
        std::string{detail::kCommittedStateKey},
        std::string{reinterpret_cast<const char*>(encoded.data()),
                    encoded.size()});
    if (!state_status.ok()) {
      strongbox::common::critical("failed staging committed state");
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}",
                  write_status.ToString());
    strongbox::common::critical("failed to commit write batch");
  }
}

}  // namespace strongbox::storage
