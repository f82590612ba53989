#pragma once
#include <strongbox/schema/operation_kind.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace strongbox::schema::encoding::scale {

void encode(operation_kind_t&& o, ::scale::Encoder& encoder);
void decode(operation_kind_t&& o, ::scale::Decoder& decoder);

}  // namespace strongbox::schema::encoding::scale
