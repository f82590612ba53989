#pragma once
#include <strongbox/schema/history_entry.hpp>
#include <scale/scale.hpp>

namespace strongbox::schema::encoding::scale {

void encode(strongbox::schema::history_entry<1>&& o, ::scale::Encoder& encoder);
void decode(strongbox::schema::history_entry<1>&& o, ::scale::Decoder& decoder);

}  // namespace strongbox::schema::encoding::scale
