#pragma once
#include <strongbox/common/critical.hpp>
#include <strongbox/schema/encoding/encoder.hpp>
#include <strongbox/schema/encoding/scale/account_state.hpp>
#include <strongbox/schema/encoding/scale/admin_state.hpp>
#include <strongbox/schema/encoding/scale/history_entry.hpp>
#include <strongbox/schema/encoding/scale/journal_record.hpp>
#include <strongbox/schema/encoding/scale/ledger_config.hpp>
#include <strongbox/schema/encoding/scale/ledger_totals.hpp>
#include <strongbox/schema/encoding/scale/operation_kind.hpp>
#include <scale/scale.hpp>

namespace strongbox::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  strongbox::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const strongbox::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const strongbox::schema::bytes_view_t& bytes);
};

template <typename T>
strongbox::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    strongbox::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const strongbox::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    strongbox::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const strongbox::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace strongbox::schema::encoding
