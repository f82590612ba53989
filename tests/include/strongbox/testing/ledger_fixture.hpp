#pragma once

#include <strongbox/admin/admin_registry.hpp>
#include <strongbox/execution/ledger.hpp>
#include <strongbox/schema/ledger_config.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>
#include <strongbox/testing/common.hpp>
#include <strongbox/transfer/value_transfer_gateway.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace strongbox::testing {

/// Ledger over a fresh temporary RocksDB directory with a gateway that
/// accepts every payout until a test installs its own handler.
class ledger_fixture final {
 public:
  explicit ledger_fixture(const std::string_view db_prefix,
                          const uint64_t withdraw_limit = 1000,
                          const uint64_t bank_cap = 10000)
      : db_path_{make_db_path(db_prefix)},
        config_{.withdraw_limit = make_amount(withdraw_limit),
                .bank_cap = make_amount(bank_cap)},
        storage_{strongbox::storage::make_storage<
            strongbox::storage::rocksdb_storage_tag>(db_path_)},
        gateway_{accept_all_handler()} {
    open();
  }

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;

  ~ledger_fixture() {
    ledger_.reset();
    storage_.database.reset();
    remove_path(db_path_);
  }

  /// Close and reopen the database, constructing a new ledger over it.
  void reopen(const strongbox::schema::ledger_config_t& config) {
    ledger_.reset();
    storage_.database.reset();
    storage_ = strongbox::storage::make_storage<
        strongbox::storage::rocksdb_storage_tag>(db_path_);
    config_ = config;
    open();
  }

  void reopen() { reopen(config_); }

  const std::string& db_path() const { return db_path_; }
  scale_encoder_t& encoder() { return encoder_; }
  strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
  storage() {
    return storage_;
  }
  strongbox::transfer::value_transfer_gateway& gateway() { return gateway_; }
  strongbox::execution::ledger& ledger() { return *ledger_; }

  static strongbox::transfer::transfer_handler_t accept_all_handler() {
    return [](const strongbox::schema::address_t&,
              const strongbox::schema::amount_t&) {
      return strongbox::transfer::transfer_receipt_t{.success = true};
    };
  }

 private:
  void open() {
    ledger_ = std::make_unique<strongbox::execution::ledger>(
        encoder_, storage_, gateway_, config_);
  }

  std::string db_path_;
  strongbox::schema::ledger_config_t config_;
  scale_encoder_t encoder_;
  strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>
      storage_;
  strongbox::transfer::value_transfer_gateway gateway_;
  std::unique_ptr<strongbox::execution::ledger> ledger_;
};

}  // namespace strongbox::testing
