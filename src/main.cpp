#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <strongbox/admin/admin_registry.hpp>
#include <strongbox/execution/ledger.hpp>
#include <strongbox/execution/valuation.hpp>
#include <strongbox/oracle/price_oracle_client.hpp>
#include <strongbox/schema/encoding/scale/encoder.hpp>
#include <strongbox/schema/failure.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>
#include <strongbox/transfer/value_transfer_gateway.hpp>

#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>

namespace {

namespace po = boost::program_options;

using encoder_t = strongbox::schema::encoding::encoder<
    strongbox::schema::encoding::scale_encoder_tag>;

inline constexpr auto kExitOk = 0;
inline constexpr auto kExitFailed = 1;
inline constexpr auto kExitUsage = 2;

/// Raised for malformed or missing command line input.
struct usage_error final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

strongbox::schema::address_t require_address(const po::variables_map& vm,
                                             const std::string& name) {
  if (!vm.contains(name)) {
    throw usage_error{"missing --" + name};
  }
  auto value = vm[name].as<std::string>();
  auto address = strongbox::schema::try_make_address(value);
  if (!address) {
    throw usage_error{"--" + name + " is not a 20-byte hex address: " + value};
  }
  return *address;
}

strongbox::schema::address_t optional_address(
    const po::variables_map& vm,
    const std::string& name,
    const strongbox::schema::address_t& fallback) {
  if (!vm.contains(name)) {
    return fallback;
  }
  return require_address(vm, name);
}

strongbox::schema::amount_t require_amount(const po::variables_map& vm,
                                           const std::string& name) {
  if (!vm.contains(name)) {
    throw usage_error{"missing --" + name};
  }
  auto value = vm[name].as<std::string>();
  auto amount = strongbox::schema::try_make_amount(value);
  if (!amount) {
    throw usage_error{"--" + name + " is not a 256-bit decimal amount: " +
                      value};
  }
  return *amount;
}

std::optional<strongbox::schema::price_t> parse_price(std::string_view text) {
  auto negative = !text.empty() && text.front() == '-';
  if (negative) {
    text.remove_prefix(1);
  }
  auto magnitude = strongbox::schema::try_make_amount(text);
  if (!magnitude) {
    return std::nullopt;
  }
  auto value = strongbox::schema::integer_t{*magnitude};
  if (negative) {
    value = -value;
  }
  if (value > strongbox::schema::integer_t{
                  std::numeric_limits<strongbox::schema::price_t>::max()} ||
      value < strongbox::schema::integer_t{
                  std::numeric_limits<strongbox::schema::price_t>::min()}) {
    return std::nullopt;
  }
  return static_cast<strongbox::schema::price_t>(value);
}

/// Fixed price feed configured from --price. Without --price the feed has no
/// answer and every valuation reports the oracle as unavailable.
strongbox::oracle::price_feed_t make_price_feed(const po::variables_map& vm) {
  if (!vm.contains("price")) {
    return [](const strongbox::schema::address_t&) {
      return std::optional<strongbox::schema::price_round_t>{};
    };
  }
  auto price = parse_price(vm["price"].as<std::string>());
  if (!price) {
    throw usage_error{"--price is not a signed 256-bit integer"};
  }
  auto decimals = vm["price-decimals"].as<uint32_t>();
  if (decimals > std::numeric_limits<uint8_t>::max()) {
    throw usage_error{"--price-decimals must be at most 255"};
  }
  auto round = strongbox::schema::price_round_t{
      .price = *price, .decimals = static_cast<uint8_t>(decimals)};
  return [round](const strongbox::schema::address_t& oracle_address) {
    spdlog::debug("Answering price query at {}",
                  strongbox::schema::to_string(oracle_address));
    return std::optional<strongbox::schema::price_round_t>{round};
  };
}

/// Payouts leave custody by being appended to the payout log.
strongbox::transfer::transfer_handler_t make_payout_handler(
    std::shared_ptr<spdlog::logger> payouts,
    const bool reject) {
  return [payouts = std::move(payouts), reject](
             const strongbox::schema::address_t& to,
             const strongbox::schema::amount_t& amount) {
    if (reject) {
      return strongbox::transfer::transfer_receipt_t{
          .success = false, .reason = "payouts are disabled"};
    }
    payouts->info("paid {} to {}", amount.str(),
                  strongbox::schema::to_string(to));
    payouts->flush();
    return strongbox::transfer::transfer_receipt_t{.success = true};
  };
}

int report(const strongbox::schema::transaction_result_t& result) {
  if (!result.ok()) {
    std::cerr << "failed: [" << result.codespace << "/" << result.code << "] "
              << result.log << '\n';
    return kExitFailed;
  }
  for (const auto& event : result.events) {
    std::cout << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
  return kExitOk;
}

int report(const strongbox::schema::outcome_t<strongbox::schema::integer_t>&
               outcome) {
  return std::visit(
      overloaded{[](const strongbox::schema::integer_t& value) {
                   std::cout << value.str() << '\n';
                   return kExitOk;
                 },
                 [](const strongbox::schema::failure_t& failure) {
                   std::cerr << "failed: [strongbox.oracle/"
                             << static_cast<uint32_t>(
                                    strongbox::schema::code_of(failure))
                             << "] " << strongbox::schema::describe(failure)
                             << '\n';
                   return kExitFailed;
                 }},
      outcome);
}

const std::unordered_set<std::string_view>& known_commands() {
  static const auto commands = std::unordered_set<std::string_view>{
      "deposit", "receive",       "withdraw", "balance", "history",
      "info",    "audit",         "quote",    "change-owner",
      "update-oracle"};
  return commands;
}

/// Owner persisted on first use. Only an explicit --owner or --caller can
/// seed it; the zero address is never accepted.
strongbox::schema::address_t initial_owner(const po::variables_map& vm) {
  auto owner = vm.contains("owner") ? require_address(vm, "owner")
                                    : require_address(vm, "caller");
  if (owner == strongbox::schema::address_t{}) {
    throw usage_error{"the initial owner must not be the zero address"};
  }
  return owner;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  strongbox deposit|receive|withdraw --caller ADDR --amount N\n"
            << "  strongbox balance|history --account ADDR\n"
            << "  strongbox change-owner|update-oracle --caller ADDR "
               "--new-address ADDR\n"
            << "  strongbox quote [--account ADDR] --price P\n"
            << "  strongbox info|audit\n\n";
  std::cout << options << '\n';
}

void install_logger(const po::variables_map& vm) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      vm["log-file"].as<std::string>(), false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "strongbox", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);
}

int run(const std::string& command, const po::variables_map& vm) {
  if (!known_commands().contains(command)) {
    throw usage_error{"unknown command: " + command};
  }
  auto caller = optional_address(vm, "caller", {});
  auto oracle_address = optional_address(vm, "oracle", {});
  auto storage = strongbox::storage::make_storage<
      strongbox::storage::rocksdb_storage_tag>(vm["db"].as<std::string>());
  auto encoder = encoder_t{};

  auto owner = strongbox::schema::address_t{};
  if (!strongbox::admin::admin_registry::initialized(storage)) {
    owner = initial_owner(vm);
  }
  auto registry =
      strongbox::admin::admin_registry{encoder, storage, owner, oracle_address};

  auto payouts = spdlog::basic_logger_mt(
      "payouts", vm["payout-log"].as<std::string>(), false);
  payouts->set_pattern("%Y-%m-%d %H:%M:%S.%e %v");
  auto gateway = strongbox::transfer::value_transfer_gateway{
      make_payout_handler(payouts, vm.contains("reject-payouts"))};

  auto ledger = strongbox::execution::ledger{
      encoder, storage, gateway,
      strongbox::schema::ledger_config_t{
          .withdraw_limit = require_amount(vm, "withdraw-limit"),
          .bank_cap = require_amount(vm, "bank-cap")}};
  auto oracle = strongbox::oracle::price_oracle_client{registry,
                                                       make_price_feed(vm)};

  if (command == "deposit") {
    return report(ledger.deposit(require_address(vm, "caller"),
                                 require_amount(vm, "amount")));
  }
  if (command == "receive") {
    return report(ledger.receive(require_address(vm, "caller"),
                                 require_amount(vm, "amount")));
  }
  if (command == "withdraw") {
    return report(ledger.withdraw(require_address(vm, "caller"),
                                  require_amount(vm, "amount")));
  }
  if (command == "balance") {
    auto account = optional_address(vm, "account", caller);
    std::cout << ledger.get_balance(account).str() << '\n';
    return kExitOk;
  }
  if (command == "history") {
    auto account = optional_address(vm, "account", caller);
    for (const auto& entry : ledger.history(account)) {
      std::cout << strongbox::schema::to_string(entry.kind) << ' '
                << entry.index << ' ' << entry.amount.str() << '\n';
    }
    return kExitOk;
  }
  if (command == "change-owner") {
    return report(registry.change_owner(require_address(vm, "caller"),
                                        require_address(vm, "new-address")));
  }
  if (command == "update-oracle") {
    return report(registry.update_oracle_address(
        require_address(vm, "caller"), require_address(vm, "new-address")));
  }
  if (command == "quote") {
    if (vm.contains("account")) {
      return report(strongbox::execution::balance_in_quote_currency(
          ledger, oracle, require_address(vm, "account")));
    }
    return report(strongbox::execution::total_in_quote_currency(ledger, oracle));
  }
  if (command == "info") {
    auto info = ledger.info();
    auto totals = ledger.totals();
    std::cout << "name: " << info.data << '\n'
              << "version: " << info.version << '\n'
              << "sequence: " << info.committed_sequence << '\n'
              << "state_root: "
              << strongbox::schema::to_hex(strongbox::schema::bytes_view_t{
                     info.state_root.data(), info.state_root.size()})
              << '\n'
              << "total_balance: " << totals.total_balance.str() << '\n'
              << "deposit_count: " << totals.deposit_count << '\n'
              << "withdrawal_count: " << totals.withdrawal_count << '\n'
              << "withdraw_limit: " << ledger.withdraw_limit().str() << '\n'
              << "bank_cap: " << ledger.bank_cap().str() << '\n'
              << "owner: " << strongbox::schema::to_string(registry.owner())
              << '\n'
              << "oracle: "
              << strongbox::schema::to_string(registry.oracle_address())
              << '\n';
    return kExitOk;
  }
  if (command == "audit") {
    auto audit = ledger.audit();
    std::cout << "accounts: " << audit.account_count << '\n'
              << "balance_sum: " << audit.balance_sum.str() << '\n'
              << "total_balance: " << audit.total_balance.str() << '\n'
              << "balanced: " << (audit.balanced ? "yes" : "no") << '\n'
              << "within_cap: " << (audit.within_cap ? "yes" : "no") << '\n';
    return audit.ok() ? kExitOk : kExitFailed;
  }
  throw usage_error{"unknown command: " + command};
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"strongbox options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "deposit|receive|withdraw|balance|history|info|audit|change-owner|"
      "update-oracle|quote")(
      "config", po::value<std::string>(),
      "INI file with default option values")(
      "db", po::value<std::string>()->default_value("strongbox.db"),
      "RocksDB directory")(
      "withdraw-limit",
      po::value<std::string>()->default_value("1000000000000000000"),
      "per-withdrawal ceiling in minor units")(
      "bank-cap",
      po::value<std::string>()->default_value("100000000000000000000"),
      "custody pool capacity in minor units")(
      "owner", po::value<std::string>(),
      "owner seeded on first use (defaults to --caller)")(
      "oracle", po::value<std::string>(), "initial price feed address")(
      "caller", po::value<std::string>(), "address performing the operation")(
      "account", po::value<std::string>(), "address to inspect")(
      "amount", po::value<std::string>(), "amount in minor units")(
      "new-address", po::value<std::string>(),
      "new owner or price feed address")(
      "price", po::value<std::string>(), "price answered by the feed")(
      "price-decimals", po::value<uint32_t>()->default_value(8),
      "fixed-point decimals of --price")(
      "payout-log", po::value<std::string>()->default_value("payouts.log"),
      "file receiving payouts")(
      "reject-payouts", "make every payout fail")(
      "log-file", po::value<std::string>()->default_value("strongbox.log"),
      "application log file")("verbose,v", "enable debug logging");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      po::store(
          po::parse_config_file<char>(vm["config"].as<std::string>().c_str(),
                                      options),
          vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << "strongbox: " << ex.what() << '\n';
    return kExitUsage;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return vm.contains("help") ? kExitOk : kExitUsage;
  }

  install_logger(vm);
  auto exit_code = kExitOk;
  try {
    exit_code = run(command, vm);
  } catch (const usage_error& ex) {
    std::cerr << "strongbox: " << ex.what() << '\n';
    exit_code = kExitUsage;
  }
  spdlog::shutdown();
  return exit_code;
}
