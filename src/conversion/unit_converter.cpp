#include <strongbox/conversion/unit_converter.hpp>

#include <boost/multiprecision/cpp_int.hpp>

namespace strongbox::conversion {

strongbox::schema::integer_t pow10(const uint8_t exponent) {
  return boost::multiprecision::pow(strongbox::schema::integer_t{10},
                                    exponent);
}

strongbox::schema::integer_t rescale(const strongbox::schema::integer_t& amount,
                                     const uint8_t from_decimals,
                                     const uint8_t to_decimals) {
  if (from_decimals == to_decimals) {
    return amount;
  }
  if (from_decimals > to_decimals) {
    return amount / pow10(static_cast<uint8_t>(from_decimals - to_decimals));
  }
  return amount * pow10(static_cast<uint8_t>(to_decimals - from_decimals));
}

strongbox::schema::integer_t to_major_unit(
    const strongbox::schema::integer_t& amount_minor) {
  return rescale(amount_minor, kMajorUnitDecimals, 0);
}

strongbox::schema::integer_t from_major_unit(
    const strongbox::schema::integer_t& amount_major) {
  return rescale(amount_major, 0, kMajorUnitDecimals);
}

}  // namespace strongbox::conversion
