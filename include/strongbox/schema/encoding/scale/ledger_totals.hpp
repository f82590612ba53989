#pragma once
#include <strongbox/schema/ledger_totals.hpp>
#include <scale/scale.hpp>

namespace strongbox::schema::encoding::scale {

void encode(strongbox::schema::ledger_totals<1>&& o, ::scale::Encoder& encoder);
void decode(strongbox::schema::ledger_totals<1>&& o, ::scale::Decoder& decoder);

}  // namespace strongbox::schema::encoding::scale
