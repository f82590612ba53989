#pragma once
#include <strongbox/schema/journal_record.hpp>
#include <scale/scale.hpp>

namespace strongbox::schema::encoding::scale {

void encode(strongbox::schema::journal_record<1>&& o, ::scale::Encoder& encoder);
void decode(strongbox::schema::journal_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace strongbox::schema::encoding::scale
