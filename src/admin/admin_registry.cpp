#include <spdlog/spdlog.h>
#include <strongbox/admin/admin_registry.hpp>
#include <strongbox/schema/key/ledger_keys.hpp>

namespace strongbox::admin {

namespace {

inline constexpr auto kCodespace = std::string_view{"strongbox.admin"};

}  // namespace

admin_registry::admin_registry(
    strongbox::schema::encoding::encoder<
        strongbox::schema::encoding::scale_encoder_tag>& encoder,
    strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
        storage,
    const strongbox::schema::address_t& initial_owner,
    const strongbox::schema::address_t& initial_oracle_address)
    : encoder_{encoder}, storage_{storage} {
  auto lock = std::scoped_lock{mutex_};
  auto key = strongbox::schema::key::make_admin_key();
  auto stored = storage_.get<strongbox::schema::admin_state_t>(
      encoder_, strongbox::schema::bytes_view_t{key.data(), key.size()});
  if (stored) {
    state_ = *stored;
    spdlog::debug("Loaded admin state, owner {}",
                  strongbox::schema::to_string(state_.owner));
    return;
  }
  state_.owner = initial_owner;
  state_.oracle_address = initial_oracle_address;
  persist();
  spdlog::info("Initialized admin state, owner {} oracle {}",
               strongbox::schema::to_string(state_.owner),
               strongbox::schema::to_string(state_.oracle_address));
}

bool admin_registry::initialized(
    const strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
        storage) {
  auto key = strongbox::schema::key::make_admin_key();
  return storage
      .get_raw(strongbox::schema::bytes_view_t{key.data(), key.size()})
      .has_value();
}

strongbox::schema::transaction_result_t admin_registry::change_owner(
    const strongbox::schema::address_t& caller,
    const strongbox::schema::address_t& new_owner) {
  auto lock = std::scoped_lock{mutex_};
  if (caller != state_.owner) {
    spdlog::warn("Rejected owner change requested by {}",
                 strongbox::schema::to_string(caller));
    return strongbox::schema::make_failed_result(
        strongbox::schema::not_authorized{.caller = caller},
        std::string{kCodespace});
  }

  auto previous = state_.owner;
  state_.owner = new_owner;
  persist();
  spdlog::info("Owner changed from {} to {}",
               strongbox::schema::to_string(previous),
               strongbox::schema::to_string(new_owner));

  auto result = strongbox::schema::transaction_result_t{};
  result.info = "owner changed";
  result.events.push_back(
      strongbox::schema::make_owner_changed_event(previous, new_owner));
  return result;
}

strongbox::schema::transaction_result_t admin_registry::update_oracle_address(
    const strongbox::schema::address_t& caller,
    const strongbox::schema::address_t& new_address) {
  auto lock = std::scoped_lock{mutex_};
  if (caller != state_.owner) {
    spdlog::warn("Rejected oracle update requested by {}",
                 strongbox::schema::to_string(caller));
    return strongbox::schema::make_failed_result(
        strongbox::schema::not_authorized{.caller = caller},
        std::string{kCodespace});
  }

  state_.oracle_address = new_address;
  persist();
  spdlog::info("Oracle address updated to {}",
               strongbox::schema::to_string(new_address));

  auto result = strongbox::schema::transaction_result_t{};
  result.info = "oracle address updated";
  result.events.push_back(
      strongbox::schema::make_oracle_updated_event(new_address));
  return result;
}

strongbox::schema::address_t admin_registry::owner() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.owner;
}

strongbox::schema::address_t admin_registry::oracle_address() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.oracle_address;
}

bool admin_registry::is_owner(
    const strongbox::schema::address_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return account == state_.owner;
}

void admin_registry::persist() {
  auto key = strongbox::schema::key::make_admin_key();
  storage_.put(encoder_,
               strongbox::schema::bytes_view_t{key.data(), key.size()},
               state_);
}

}  // namespace strongbox::admin
