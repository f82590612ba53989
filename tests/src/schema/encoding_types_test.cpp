#include <gtest/gtest.h>
#include <strongbox/blake3/hash.hpp>
#include <strongbox/schema/encoding/scale/encoder.hpp>
#include <strongbox/schema/error_code.hpp>
#include <strongbox/schema/failure.hpp>
#include <strongbox/schema/journal_record.hpp>
#include <strongbox/schema/key/builder.hpp>
#include <strongbox/schema/key/ledger_keys.hpp>
#include <strongbox/schema/ledger_totals.hpp>
#include <strongbox/schema/operation_kind.hpp>
#include <strongbox/schema/transaction_result.hpp>
#include <strongbox/testing/common.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>

namespace {

using strongbox::schema::operation_kind_t;
using strongbox::testing::make_address;

}  // namespace

TEST(encoding_types, ledger_totals_round_trip) {
  auto encoder = strongbox::testing::scale_encoder_t{};
  auto totals = strongbox::schema::ledger_totals_t{
      .total_balance = strongbox::schema::amount_t{"123456789012345678901234567890"},
      .deposit_count = 7,
      .withdrawal_count = 3};
  auto encoded = encoder.encode(totals);
  auto decoded = encoder.decode<strongbox::schema::ledger_totals_t>(
      strongbox::schema::bytes_view_t{encoded.data(), encoded.size()});
  EXPECT_EQ(decoded.version, 1u);
  EXPECT_EQ(decoded.total_balance, totals.total_balance);
  EXPECT_EQ(decoded.deposit_count, 7u);
  EXPECT_EQ(decoded.withdrawal_count, 3u);
}

TEST(encoding_types, journal_record_encoding_is_stable) {
  auto encoder = strongbox::testing::scale_encoder_t{};
  auto record = strongbox::schema::journal_record_t{
      .sequence = 1,
      .kind = operation_kind_t::withdrawal,
      .account = make_address(1),
      .amount = strongbox::schema::amount_t{800}};
  auto encoded = encoder.encode(record);

  // version u16, sequence u64, kind u8, then the account bytes.
  ASSERT_GT(encoded.size(), 31u);
  EXPECT_EQ(encoded[0], 0x01);
  EXPECT_EQ(encoded[2], 0x01);
  EXPECT_EQ(encoded[10], 0x01);
  EXPECT_EQ(encoded[11], make_address(1)[0]);
  EXPECT_EQ(encoded[30], make_address(1)[19]);

  auto decoded = encoder.decode<strongbox::schema::journal_record_t>(
      strongbox::schema::bytes_view_t{encoded.data(), encoded.size()});
  EXPECT_EQ(decoded.kind, operation_kind_t::withdrawal);
  EXPECT_EQ(decoded.account, record.account);
  EXPECT_EQ(decoded.amount, record.amount);
}

TEST(encoding_types, try_decode_rejects_truncated_bytes) {
  auto encoder = strongbox::testing::scale_encoder_t{};
  auto bytes = strongbox::schema::bytes_t{0x01};
  auto decoded = encoder.try_decode<strongbox::schema::ledger_totals_t>(
      strongbox::schema::bytes_view_t{bytes.data(), bytes.size()});
  EXPECT_FALSE(decoded.has_value());
}

TEST(encoding_types, operation_kind_names_round_trip) {
  EXPECT_EQ(strongbox::schema::to_string(operation_kind_t::deposit), "deposit");
  EXPECT_EQ(strongbox::schema::to_string(operation_kind_t::withdrawal),
            "withdrawal");
  EXPECT_EQ(
      strongbox::schema::try_from_string<operation_kind_t>("withdrawal"),
      operation_kind_t::withdrawal);
  EXPECT_FALSE(
      strongbox::schema::try_from_string<operation_kind_t>("transfer"));
}

TEST(encoding_types, history_keys_sort_by_kind_then_index) {
  auto account = make_address(4);
  auto deposit_two = strongbox::schema::key::make_history_key(
      account, operation_kind_t::deposit, 2);
  auto deposit_ten = strongbox::schema::key::make_history_key(
      account, operation_kind_t::deposit, 10);
  auto withdrawal_one = strongbox::schema::key::make_history_key(
      account, operation_kind_t::withdrawal, 1);
  EXPECT_LT(deposit_two, deposit_ten);
  EXPECT_LT(deposit_ten, withdrawal_one);

  auto prefix = strongbox::schema::key::make_history_prefix(account);
  ASSERT_EQ(deposit_two.size(), prefix.size() + 1 + 8);
  EXPECT_TRUE(std::equal(std::begin(prefix), std::end(prefix),
                         std::begin(deposit_two)));
}

TEST(encoding_types, account_keys_parse_back) {
  auto key = strongbox::schema::key::make_account_key(make_address(9));
  auto parsed = strongbox::schema::key::parse_account_key(
      strongbox::schema::bytes_view_t{key.data(), key.size()});
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, make_address(9));

  auto totals = strongbox::schema::key::make_totals_key();
  EXPECT_FALSE(strongbox::schema::key::parse_account_key(
                   strongbox::schema::bytes_view_t{totals.data(),
                                                   totals.size()})
                   .has_value());
}

TEST(encoding_types, key_builder_writes_integers_big_endian) {
  auto builder = strongbox::schema::key::builder{};
  builder.write(std::string_view{"K|"}).write(uint32_t{0x01020304});
  EXPECT_EQ(builder.data,
            (strongbox::schema::bytes_t{'K', '|', 0x01, 0x02, 0x03, 0x04}));
}

TEST(encoding_types, failures_map_to_stable_codes) {
  EXPECT_EQ(static_cast<uint32_t>(strongbox::schema::code_of(
                strongbox::schema::capacity_exceeded{})),
            1u);
  EXPECT_EQ(static_cast<uint32_t>(strongbox::schema::code_of(
                strongbox::schema::not_authorized{})),
            6u);

  auto result = strongbox::schema::make_failed_result(
      strongbox::schema::limit_exceeded{
          .requested = strongbox::schema::amount_t{1500},
          .withdraw_limit = strongbox::schema::amount_t{1000}},
      "strongbox.ledger");
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.code, 2u);
  EXPECT_EQ(result.codespace, "strongbox.ledger");
  EXPECT_NE(result.log.find("1500"), std::string::npos);
  EXPECT_NE(result.log.find("1000"), std::string::npos);
}

TEST(encoding_types, fold_chains_material) {
  auto zero = strongbox::schema::make_zero_hash();
  auto a = strongbox::schema::bytes_t{0x01};
  auto b = strongbox::schema::bytes_t{0x02};
  auto first = strongbox::blake3::fold(
      zero, strongbox::schema::bytes_view_t{a.data(), a.size()});
  EXPECT_NE(first, zero);
  EXPECT_EQ(first, strongbox::blake3::fold(
                       zero, strongbox::schema::bytes_view_t{a.data(),
                                                             a.size()}));
  EXPECT_NE(first, strongbox::blake3::fold(
                       zero, strongbox::schema::bytes_view_t{b.data(),
                                                             b.size()}));
}
