#pragma once
#include <strongbox/schema/primitives.hpp>
#include <optional>
#include <span>

namespace strongbox::schema::encoding {

/// Codec facade selected at build time by tag. Storage and key helpers are
/// written against this interface so the wire format can change without
/// touching ledger code.
template <typename Library>
struct encoder {
  template <typename T>
  strongbox::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const strongbox::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const strongbox::schema::bytes_view_t& bytes);
};

}  // namespace strongbox::schema::encoding
