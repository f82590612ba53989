#pragma once

#include <strongbox/guard/reentrancy_guard.hpp>
#include <strongbox/schema/account_state.hpp>
#include <strongbox/schema/app_info.hpp>
#include <strongbox/schema/audit_result.hpp>
#include <strongbox/schema/encoding/encoder.hpp>
#include <strongbox/schema/history_entry.hpp>
#include <strongbox/schema/journal_record.hpp>
#include <strongbox/schema/ledger_config.hpp>
#include <strongbox/schema/ledger_totals.hpp>
#include <strongbox/schema/operation_kind.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/transaction_result.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>
#include <strongbox/storage/write_set.hpp>
#include <strongbox/transfer/value_transfer_gateway.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace strongbox::execution {

/// Custody ledger for a single value unit.
///
/// Owns every account balance, the pool totals, the global deposit and
/// withdrawal counters and per-account history. All operations serialize on
/// one recursive mutex: a transfer callback running on the calling thread can
/// re-enter the ledger, reach the reentrancy guard and be refused, instead of
/// deadlocking.
///
/// Every mutating operation stages its writes in a transaction layered over
/// the operation that is currently in flight (if any). A top-level operation
/// commits its transaction as one RocksDB write batch and folds its journal
/// records into the state root; a nested one merges into its parent and
/// shares the parent's fate.
class ledger final {
 public:
  /// Open the ledger over storage. config is persisted on first open and
  /// ignored (with a warning when it differs) once a persisted config exists.
  ledger(strongbox::schema::encoding::encoder<
             strongbox::schema::encoding::scale_encoder_tag>& encoder,
         strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
             storage,
         strongbox::transfer::value_transfer_gateway& gateway,
         const strongbox::schema::ledger_config_t& config);

  ledger(const ledger&) = delete;
  ledger& operator=(const ledger&) = delete;

  /// Credit amount to caller.
  ///
  /// Fails capacity_exceeded, with nothing staged, when the pool would exceed
  /// bank_cap. A zero amount is accepted: it still bumps deposit_count and
  /// writes a zero-amount history entry.
  strongbox::schema::transaction_result_t deposit(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& amount);

  /// Value received without an operation selector; same as deposit.
  strongbox::schema::transaction_result_t receive(
      const strongbox::schema::address_t& sender,
      const strongbox::schema::amount_t& amount);

  /// Debit amount from caller and pay it out through the gateway.
  ///
  /// Guarded against reentry. Checks withdraw_limit, then the caller's
  /// balance; stages the debit, counter bump and history entry; only then
  /// sends. A failed send discards everything staged by this call and by any
  /// operation nested inside the send.
  strongbox::schema::transaction_result_t withdraw(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& amount);

  /// Balance of account; zero for unknown accounts. Never fails.
  strongbox::schema::amount_t get_balance(
      const strongbox::schema::address_t& account) const;

  strongbox::schema::ledger_totals_t totals() const;
  strongbox::schema::amount_t total_balance() const;
  uint64_t deposit_count() const;
  uint64_t withdrawal_count() const;

  const strongbox::schema::ledger_config_t& config() const { return config_; }
  const strongbox::schema::amount_t& withdraw_limit() const {
    return config_.withdraw_limit;
  }
  const strongbox::schema::amount_t& bank_cap() const {
    return config_.bank_cap;
  }

  /// History of account ordered by kind, then by global index.
  ///
  /// Entries are keyed by (account, kind, index) rather than by index alone,
  /// because deposit and withdrawal indexes are counted separately and would
  /// otherwise overwrite each other. Every entry is written once.
  std::vector<strongbox::schema::history_entry_t> history(
      const strongbox::schema::address_t& account) const;

  std::optional<strongbox::schema::history_entry_t> find_history_entry(
      const strongbox::schema::address_t& account,
      strongbox::schema::operation_kind_t kind,
      uint64_t index) const;

  /// Scan all accounts and check them against the pool totals.
  strongbox::schema::audit_result_t audit() const;

  /// Journal head and application metadata.
  strongbox::schema::app_info_t info() const;

  strongbox::guard::latch_state_t guard_state() const;

 private:
  using storage_t =
      strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>;
  using write_set_t = strongbox::storage::write_set<storage_t>;

  /// Writes and journal records of one in-flight operation.
  struct transaction final {
    explicit transaction(const storage_t& storage, transaction* parent)
        : writes{storage, parent != nullptr ? &parent->writes : nullptr},
          parent{parent} {}

    write_set_t writes;
    std::vector<strongbox::schema::journal_record_t> journal;
    transaction* parent;
  };

  /// Makes a transaction the innermost one for the duration of a call out of
  /// the ledger.
  class active_scope final {
   public:
    active_scope(transaction*& active, transaction& current)
        : active_{active}, previous_{active} {
      active_ = &current;
    }
    active_scope(const active_scope&) = delete;
    active_scope& operator=(const active_scope&) = delete;
    ~active_scope() { active_ = previous_; }

   private:
    transaction*& active_;
    transaction* previous_;
  };

  strongbox::schema::ledger_totals_t load_totals(
      const write_set_t& view) const;
  strongbox::schema::account_state_t load_account(
      const write_set_t& view,
      const strongbox::schema::address_t& account) const;

  void stage(transaction& tx,
             strongbox::schema::operation_kind_t kind,
             const strongbox::schema::address_t& account,
             const strongbox::schema::account_state_t& state,
             const strongbox::schema::ledger_totals_t& totals,
             const strongbox::schema::amount_t& amount);

  /// Merge into the parent transaction, or persist atomically when top-level.
  void commit(transaction& tx);

  void load_config(const strongbox::schema::ledger_config_t& requested);

  mutable std::recursive_mutex mutex_;
  strongbox::schema::encoding::encoder<
      strongbox::schema::encoding::scale_encoder_tag>& encoder_;
  storage_t& storage_;
  strongbox::transfer::value_transfer_gateway& gateway_;
  strongbox::guard::reentrancy_guard guard_;
  strongbox::schema::ledger_config_t config_;
  strongbox::storage::committed_state committed_;
  transaction* active_{nullptr};
};

}  // namespace strongbox::execution
