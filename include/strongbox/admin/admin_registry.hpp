#pragma once

#include <strongbox/schema/admin_state.hpp>
#include <strongbox/schema/encoding/encoder.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/transaction_result.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>

#include <mutex>

namespace strongbox::admin {

/// Owner identity and price feed address, persisted alongside the ledger.
///
/// Both mutations are gated on the caller being the current owner.
class admin_registry final {
 public:
  /// Load persisted admin state, or persist the given initial values when the
  /// database has none yet.
  admin_registry(
      strongbox::schema::encoding::encoder<
          strongbox::schema::encoding::scale_encoder_tag>& encoder,
      strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
          storage,
      const strongbox::schema::address_t& initial_owner,
      const strongbox::schema::address_t& initial_oracle_address);

  /// True once admin state has been persisted to storage.
  static bool initialized(
      const strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
          storage);

  /// Reassign ownership. Fails not_authorized unless caller is the owner.
  strongbox::schema::transaction_result_t change_owner(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::address_t& new_owner);

  /// Repoint the price feed. Fails not_authorized unless caller is the owner.
  strongbox::schema::transaction_result_t update_oracle_address(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::address_t& new_address);

  strongbox::schema::address_t owner() const;
  strongbox::schema::address_t oracle_address() const;
  bool is_owner(const strongbox::schema::address_t& account) const;

 private:
  void persist();

  mutable std::mutex mutex_;
  strongbox::schema::encoding::encoder<
      strongbox::schema::encoding::scale_encoder_tag>& encoder_;
  strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
      storage_;
  strongbox::schema::admin_state_t state_;
};

}  // namespace strongbox::admin
