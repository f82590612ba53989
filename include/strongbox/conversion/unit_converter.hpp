#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>

namespace strongbox::conversion {

/// Minor units per major unit of the custodied currency (wei per ether).
inline constexpr uint8_t kMajorUnitDecimals = 18;

/// 10^exponent.
strongbox::schema::integer_t pow10(uint8_t exponent);

/// Move a fixed-point integer from from_decimals to to_decimals of precision.
///
/// Growing precision multiplies and is exact. Shrinking precision divides and
/// truncates toward zero: the discarded remainder is lost, which is expected
/// and not an error. Arithmetic is unbounded, so nothing wraps.
strongbox::schema::integer_t rescale(const strongbox::schema::integer_t& amount,
                                     uint8_t from_decimals,
                                     uint8_t to_decimals);

/// Minor to major units, truncating. Lossy: from_major_unit(to_major_unit(x))
/// equals x only when x is a whole number of major units.
strongbox::schema::integer_t to_major_unit(
    const strongbox::schema::integer_t& amount_minor);

strongbox::schema::integer_t from_major_unit(
    const strongbox::schema::integer_t& amount_major);

}  // namespace strongbox::conversion
