#include <spdlog/spdlog.h>
#include <strongbox/blake3/hash.hpp>
#include <strongbox/execution/ledger.hpp>
#include <strongbox/schema/encoding/scale/encoder.hpp>
#include <strongbox/schema/key/ledger_keys.hpp>
#include <iterator>
#include <string>
#include <utility>

using namespace strongbox::schema;

namespace {

inline constexpr auto kCodespace = std::string_view{"strongbox.ledger"};

bytes_view_t view_of(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

namespace strongbox::execution {

ledger::ledger(
    strongbox::schema::encoding::encoder<
        strongbox::schema::encoding::scale_encoder_tag>& encoder,
    strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
        storage,
    strongbox::transfer::value_transfer_gateway& gateway,
    const ledger_config_t& config)
    : encoder_{encoder}, storage_{storage}, gateway_{gateway} {
  auto lock = std::scoped_lock{mutex_};
  load_config(config);

  if (auto committed = storage_.load_committed_state()) {
    committed_ = *committed;
  } else {
    committed_.state_root = make_zero_hash();
  }
  spdlog::info(
      "Ledger ready: withdraw limit {}, bank cap {}, committed sequence {}",
      config_.withdraw_limit.str(), config_.bank_cap.str(),
      committed_.sequence);
}

void ledger::load_config(const ledger_config_t& requested) {
  auto key = strongbox::schema::key::make_config_key();
  auto stored = storage_.get<ledger_config_t>(encoder_, view_of(key));
  if (!stored) {
    config_ = requested;
    storage_.put(encoder_, view_of(key), config_);
    spdlog::debug("Persisted initial ledger configuration");
    return;
  }
  config_ = *stored;
  if (stored->withdraw_limit != requested.withdraw_limit ||
      stored->bank_cap != requested.bank_cap) {
    spdlog::warn(
        "Ignoring requested configuration (limit {}, cap {}); ledger was "
        "created with limit {}, cap {}",
        requested.withdraw_limit.str(), requested.bank_cap.str(),
        config_.withdraw_limit.str(), config_.bank_cap.str());
  }
}

transaction_result_t ledger::deposit(const address_t& caller,
                                     const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = transaction{storage_, active_};

  auto totals = load_totals(tx.writes);
  auto new_total = integer_t{totals.total_balance} + integer_t{amount};
  if (new_total > integer_t{config_.bank_cap}) {
    spdlog::warn("Rejected deposit of {} by {}: pool would reach {} of {}",
                 amount.str(), to_string(caller), new_total.str(),
                 config_.bank_cap.str());
    return make_failed_result(
        capacity_exceeded{.requested_total = new_total,
                          .bank_cap = config_.bank_cap},
        std::string{kCodespace});
  }

  auto account = load_account(tx.writes, caller);
  account.balance += amount;
  totals.total_balance = static_cast<amount_t>(new_total);
  ++totals.deposit_count;
  stage(tx, operation_kind_t::deposit, caller, account, totals, amount);
  commit(tx);

  spdlog::info("Deposit #{} of {} by {}, balance {}", totals.deposit_count,
               amount.str(), to_string(caller), account.balance.str());
  auto result = transaction_result_t{};
  result.info = "deposit accepted";
  result.events.push_back(
      make_deposit_event(caller, amount, account.balance));
  return result;
}

transaction_result_t ledger::receive(const address_t& sender,
                                     const amount_t& amount) {
  spdlog::debug("Treating inbound value from {} as deposit",
                to_string(sender));
  return deposit(sender, amount);
}

transaction_result_t ledger::withdraw(const address_t& caller,
                                      const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = guard_.acquire();
  if (!entry) {
    return make_failed_result(reentrancy_detected{}, std::string{kCodespace});
  }

  if (amount > config_.withdraw_limit) {
    spdlog::warn("Rejected withdrawal of {} by {}: limit {}", amount.str(),
                 to_string(caller), config_.withdraw_limit.str());
    return make_failed_result(
        limit_exceeded{.requested = amount,
                       .withdraw_limit = config_.withdraw_limit},
        std::string{kCodespace});
  }

  auto tx = transaction{storage_, active_};
  auto account = load_account(tx.writes, caller);
  if (amount > account.balance) {
    spdlog::warn("Rejected withdrawal of {} by {}: balance {}", amount.str(),
                 to_string(caller), account.balance.str());
    return make_failed_result(
        insufficient_funds{
            .account = caller, .requested = amount, .balance = account.balance},
        std::string{kCodespace});
  }

  auto totals = load_totals(tx.writes);
  account.balance -= amount;
  totals.total_balance -= amount;
  ++totals.withdrawal_count;
  stage(tx, operation_kind_t::withdrawal, caller, account, totals, amount);

  auto receipt = strongbox::transfer::transfer_receipt_t{};
  {
    auto scope = active_scope{active_, tx};
    receipt = gateway_.send(caller, amount);
  }
  if (!receipt.success) {
    spdlog::warn("Withdrawal of {} by {} reverted: {}", amount.str(),
                 to_string(caller), receipt.reason);
    return make_failed_result(transfer_failed{.reason = receipt.reason},
                              std::string{kCodespace});
  }

  // The callback may have staged nested deposits; the balance to report is
  // the one this transaction now holds.
  auto new_balance = load_account(tx.writes, caller).balance;
  commit(tx);

  spdlog::info("Withdrawal #{} of {} by {}, balance {}",
               totals.withdrawal_count, amount.str(), to_string(caller),
               new_balance.str());
  auto result = transaction_result_t{};
  result.info = "withdrawal paid";
  result.events.push_back(make_withdrawal_event(caller, amount, new_balance));
  return result;
}

amount_t ledger::get_balance(const address_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  auto view = write_set_t{storage_, active_ != nullptr ? &active_->writes
                                                       : nullptr};
  return load_account(view, account).balance;
}

ledger_totals_t ledger::totals() const {
  auto lock = std::scoped_lock{mutex_};
  auto view = write_set_t{storage_, active_ != nullptr ? &active_->writes
                                                       : nullptr};
  return load_totals(view);
}

amount_t ledger::total_balance() const {
  return totals().total_balance;
}

uint64_t ledger::deposit_count() const {
  return totals().deposit_count;
}

uint64_t ledger::withdrawal_count() const {
  return totals().withdrawal_count;
}

std::vector<history_entry_t> ledger::history(const address_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  auto view = write_set_t{storage_, active_ != nullptr ? &active_->writes
                                                       : nullptr};
  auto prefix = strongbox::schema::key::make_history_prefix(account);
  auto rows = view.list_by_prefix(view_of(prefix));

  auto entries = std::vector<history_entry_t>{};
  entries.reserve(rows.size());
  for (const auto& [key, value] : rows) {
    entries.push_back(encoder_.decode<history_entry_t>(view_of(value)));
  }
  return entries;
}

std::optional<history_entry_t> ledger::find_history_entry(
    const address_t& account,
    const operation_kind_t kind,
    const uint64_t index) const {
  auto lock = std::scoped_lock{mutex_};
  auto view = write_set_t{storage_, active_ != nullptr ? &active_->writes
                                                       : nullptr};
  return view.get<history_entry_t>(
      encoder_, strongbox::schema::key::make_history_key(account, kind, index));
}

audit_result_t ledger::audit() const {
  auto lock = std::scoped_lock{mutex_};
  auto view = write_set_t{storage_, active_ != nullptr ? &active_->writes
                                                       : nullptr};
  auto prefix = strongbox::schema::key::make_account_prefix();

  auto result = audit_result_t{};
  for (const auto& [key, value] : view.list_by_prefix(view_of(prefix))) {
    if (!strongbox::schema::key::parse_account_key(view_of(key))) {
      spdlog::warn("Skipping malformed account key of {} bytes", key.size());
      continue;
    }
    auto state = encoder_.decode<account_state_t>(view_of(value));
    result.balance_sum += integer_t{state.balance};
    ++result.account_count;
  }

  result.total_balance = load_totals(view).total_balance;
  result.bank_cap = config_.bank_cap;
  result.balanced = result.balance_sum == integer_t{result.total_balance};
  result.within_cap = result.total_balance <= result.bank_cap;
  if (!result.ok()) {
    spdlog::error("Ledger audit failed: {} accounts sum to {}, pool holds {}",
                  result.account_count, result.balance_sum.str(),
                  result.total_balance.str());
  }
  return result;
}

app_info_t ledger::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.committed_sequence = committed_.sequence;
  result.state_root = committed_.state_root;
  return result;
}

strongbox::guard::latch_state_t ledger::guard_state() const {
  auto lock = std::scoped_lock{mutex_};
  return guard_.state();
}

ledger_totals_t ledger::load_totals(const write_set_t& view) const {
  return view.get<ledger_totals_t>(encoder_,
                                   strongbox::schema::key::make_totals_key())
      .value_or(ledger_totals_t{});
}

account_state_t ledger::load_account(const write_set_t& view,
                                     const address_t& account) const {
  return view
      .get<account_state_t>(encoder_,
                            strongbox::schema::key::make_account_key(account))
      .value_or(account_state_t{});
}

void ledger::stage(transaction& tx,
                   const operation_kind_t kind,
                   const address_t& account,
                   const account_state_t& state,
                   const ledger_totals_t& totals,
                   const amount_t& amount) {
  auto index = kind == operation_kind_t::deposit ? totals.deposit_count
                                                 : totals.withdrawal_count;
  tx.writes.put(encoder_, strongbox::schema::key::make_account_key(account),
                state);
  tx.writes.put(encoder_, strongbox::schema::key::make_totals_key(), totals);
  tx.writes.put(
      encoder_, strongbox::schema::key::make_history_key(account, kind, index),
      history_entry_t{.kind = kind, .index = index, .amount = amount});
  tx.journal.push_back(
      journal_record_t{.kind = kind, .account = account, .amount = amount});
  spdlog::debug("Staged {} #{} of {} for {}", to_string(kind), index,
                amount.str(), to_string(account));
}

void ledger::commit(transaction& tx) {
  if (tx.parent != nullptr) {
    tx.writes.merge_into_parent();
    tx.parent->journal.insert(std::end(tx.parent->journal),
                              std::begin(tx.journal), std::end(tx.journal));
    return;
  }

  auto next = committed_;
  for (auto& record : tx.journal) {
    record.sequence = ++next.sequence;
    auto material = encoder_.encode(record);
    next.state_root = strongbox::blake3::fold(next.state_root, view_of(material));
  }
  storage_.commit(tx.writes.entries(), next);
  committed_ = next;
}

}  // namespace strongbox::execution
