#include <gtest/gtest.h>
#include <strongbox/testing/common.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef STRONGBOX_CLI_PATH
#define STRONGBOX_CLI_PATH ""
#endif

namespace {

constexpr auto kAlice = "0x1111111111111111111111111111111111111111";
constexpr auto kBob = "0x2222222222222222222222222222222222222222";
constexpr auto kZero = "0x0000000000000000000000000000000000000000";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1) {
    return {-1, output};
  }
  if (WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), trim_ascii_whitespace(output)};
}

std::string read_file(const std::filesystem::path& path) {
  auto stream = std::ifstream{path};
  auto content = std::stringstream{};
  content << stream.rdbuf();
  return content.str();
}

/// Runs the CLI against one scratch directory holding the database and both
/// log files.
class cli_session final {
 public:
  explicit cli_session(std::string binary)
      : binary_{std::move(binary)},
        directory_{strongbox::testing::make_db_path("strongbox_cli")} {
    std::filesystem::create_directories(directory_);
  }

  cli_session(const cli_session&) = delete;
  cli_session& operator=(const cli_session&) = delete;

  ~cli_session() { strongbox::testing::remove_path(directory_.string()); }

  std::pair<int, std::string> run(const std::string_view command,
                                  const std::string& args = {}) const {
    return run_unowned(command, std::string{" --owner "} + kAlice + ' ' + args);
  }

  /// Same as run() without seeding the owner.
  std::pair<int, std::string> run_unowned(const std::string_view command,
                                          const std::string& args = {}) const {
    return run_capture(
        shell_quote(binary_) + ' ' + std::string{command} + " --db " +
        shell_quote((directory_ / "db").string()) + " --log-file " +
        shell_quote((directory_ / "strongbox.log").string()) +
        " --payout-log " +
        shell_quote((directory_ / "payouts.log").string()) +
        " --withdraw-limit 1000 --bank-cap 10000 " + args + " 2>/dev/null");
  }

  std::filesystem::path path(const std::string_view name) const {
    return directory_ / name;
  }

 private:
  std::string binary_;
  std::filesystem::path directory_;
};

std::string cli_binary() {
  return std::string{STRONGBOX_CLI_PATH};
}

}  // namespace

TEST(cli, reference_scenario_end_to_end) {
  auto binary = cli_binary();
  if (binary.empty() || !std::filesystem::exists(binary)) {
    GTEST_SKIP() << "strongbox binary not available: " << binary;
  }
  auto session = cli_session{binary};
  auto alice = std::string{" --caller "} + kAlice;
  auto bob = std::string{" --caller "} + kBob;

  auto [deposit_code, deposit_out] =
      session.run("deposit", alice + " --amount 5000");
  EXPECT_EQ(deposit_code, 0);
  EXPECT_EQ(deposit_out, std::string{"deposit account="} + kAlice +
                             " amount=5000 new_balance=5000");

  EXPECT_EQ(session.run("deposit", bob + " --amount 6000").first, 1);
  EXPECT_EQ(session.run("withdraw", alice + " --amount 1500").first, 1);

  auto [withdraw_code, withdraw_out] =
      session.run("withdraw", alice + " --amount 800");
  EXPECT_EQ(withdraw_code, 0);
  EXPECT_NE(withdraw_out.find("new_balance=4200"), std::string::npos);

  EXPECT_EQ(session.run("balance", std::string{" --account "} + kAlice),
            (std::pair<int, std::string>{0, "4200"}));
  EXPECT_EQ(session.run("balance", std::string{" --account "} + kBob),
            (std::pair<int, std::string>{0, "0"}));
  EXPECT_EQ(session.run("history", std::string{" --account "} + kAlice),
            (std::pair<int, std::string>{0, "deposit 1 5000\nwithdrawal 1 800"}));

  auto payouts = read_file(session.path("payouts.log"));
  EXPECT_NE(payouts.find(std::string{"paid 800 to "} + kAlice),
            std::string::npos);
}

TEST(cli, rejected_payout_leaves_balance_unchanged) {
  auto binary = cli_binary();
  if (binary.empty() || !std::filesystem::exists(binary)) {
    GTEST_SKIP() << "strongbox binary not available: " << binary;
  }
  auto session = cli_session{binary};
  auto alice = std::string{" --caller "} + kAlice;

  ASSERT_EQ(session.run("deposit", alice + " --amount 700").first, 0);
  EXPECT_EQ(
      session.run("withdraw", alice + " --amount 300 --reject-payouts").first,
      1);
  EXPECT_EQ(session.run("balance", std::string{" --account "} + kAlice).second,
            "700");

  auto [audit_code, audit_out] = session.run("audit");
  EXPECT_EQ(audit_code, 0);
  EXPECT_NE(audit_out.find("balanced: yes"), std::string::npos);
  EXPECT_NE(audit_out.find("total_balance: 700"), std::string::npos);

  auto [info_code, info_out] = session.run("info");
  EXPECT_EQ(info_code, 0);
  EXPECT_NE(info_out.find("sequence: 1"), std::string::npos);
  EXPECT_NE(info_out.find("withdrawal_count: 0"), std::string::npos);
}

TEST(cli, quote_and_administration) {
  auto binary = cli_binary();
  if (binary.empty() || !std::filesystem::exists(binary)) {
    GTEST_SKIP() << "strongbox binary not available: " << binary;
  }
  auto session = cli_session{binary};

  ASSERT_EQ(session.run("deposit", std::string{" --caller "} + kAlice +
                                       " --amount 4200")
                .first,
            0);
  EXPECT_EQ(session.run("quote", std::string{" --account "} + kAlice +
                                     " --price 200000000"),
            (std::pair<int, std::string>{0, "8400"}));
  EXPECT_EQ(session.run("quote", " --price 20000000000 --price-decimals 10"),
            (std::pair<int, std::string>{0, "8400"}));
  EXPECT_EQ(session.run("quote").first, 1);

  EXPECT_EQ(session.run("change-owner", std::string{" --caller "} + kBob +
                                            " --new-address " + kBob)
                .first,
            1);
  auto [changed_code, changed_out] = session.run(
      "change-owner",
      std::string{" --caller "} + kAlice + " --new-address " + kBob);
  EXPECT_EQ(changed_code, 0);
  EXPECT_EQ(changed_out.rfind("owner_changed", 0), 0u);

  EXPECT_EQ(session.run("update-oracle", std::string{" --caller "} + kBob +
                                             " --new-address " + kAlice)
                .first,
            0);
  auto [info_code, info_out] = session.run("info");
  EXPECT_EQ(info_code, 0);
  EXPECT_NE(info_out.find(std::string{"owner: "} + kBob), std::string::npos);
  EXPECT_NE(info_out.find(std::string{"oracle: "} + kAlice),
            std::string::npos);
}

TEST(cli, bad_usage_exits_with_two) {
  auto binary = cli_binary();
  if (binary.empty() || !std::filesystem::exists(binary)) {
    GTEST_SKIP() << "strongbox binary not available: " << binary;
  }
  auto session = cli_session{binary};

  EXPECT_EQ(session.run("deposit", std::string{" --caller "} + kAlice +
                                       " --amount twelve")
                .first,
            2);
  EXPECT_EQ(session.run("deposit", " --caller 0x1234 --amount 1").first, 2);
  EXPECT_EQ(session.run("withdraw", std::string{" --caller "} + kAlice).first,
            2);
  EXPECT_EQ(session.run("transfer").first, 2);
  EXPECT_EQ(session.run("balance", "--no-such-option").first, 2);
}

TEST(cli, config_file_supplies_defaults) {
  auto binary = cli_binary();
  if (binary.empty() || !std::filesystem::exists(binary)) {
    GTEST_SKIP() << "strongbox binary not available: " << binary;
  }
  auto session = cli_session{binary};
  auto config = session.path("strongbox.ini");
  {
    auto stream = std::ofstream{config};
    stream << "caller=" << kAlice << '\n' << "amount=250\n";
  }

  EXPECT_EQ(session.run("deposit", " --config " + shell_quote(config.string()))
                .first,
            0);
  EXPECT_EQ(session.run("balance", " --config " + shell_quote(config.string()))
                .second,
            "250");
  EXPECT_EQ(session.run("deposit", " --config " +
                                       shell_quote(config.string()) +
                                       " --amount 5")
                .first,
            0);
  EXPECT_EQ(session.run("balance", std::string{" --account "} + kAlice).second,
            "255");
}

TEST(cli, first_use_requires_an_explicit_owner) {
  auto binary = cli_binary();
  if (binary.empty() || !std::filesystem::exists(binary)) {
    GTEST_SKIP() << "strongbox binary not available: " << binary;
  }
  auto session = cli_session{binary};

  EXPECT_EQ(session.run_unowned("info").first, 2);
  EXPECT_EQ(session.run_unowned("audit").first, 2);
  EXPECT_EQ(
      session.run_unowned("balance", std::string{" --account "} + kAlice).first,
      2);
  EXPECT_EQ(session.run_unowned("info", std::string{" --caller "} + kZero).first,
            2);
  EXPECT_EQ(session.run_unowned("info", std::string{" --owner "} + kZero).first,
            2);
  EXPECT_EQ(session
                .run_unowned("change-owner", std::string{" --caller "} + kZero +
                                                 " --new-address " + kBob)
                .first,
            2);

  auto [info_code, info_out] =
      session.run_unowned("info", std::string{" --caller "} + kAlice);
  EXPECT_EQ(info_code, 0);
  EXPECT_NE(info_out.find(std::string{"owner: "} + kAlice), std::string::npos);

  EXPECT_EQ(session
                .run_unowned("change-owner", std::string{" --caller "} + kZero +
                                                 " --new-address " + kBob)
                .first,
            1);
  auto [after_code, after_out] = session.run_unowned("info");
  EXPECT_EQ(after_code, 0);
  EXPECT_NE(after_out.find(std::string{"owner: "} + kAlice), std::string::npos);
}

TEST(cli, unknown_command_does_not_touch_the_database) {
  auto binary = cli_binary();
  if (binary.empty() || !std::filesystem::exists(binary)) {
    GTEST_SKIP() << "strongbox binary not available: " << binary;
  }
  auto session = cli_session{binary};

  EXPECT_EQ(session.run_unowned("transfer").first, 2);
  EXPECT_EQ(session.run("sweep").first, 2);
  EXPECT_FALSE(std::filesystem::exists(session.path("db")));
}
