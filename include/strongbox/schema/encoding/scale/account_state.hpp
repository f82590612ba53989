#pragma once
#include <strongbox/schema/account_state.hpp>
#include <scale/scale.hpp>

namespace strongbox::schema::encoding::scale {

void encode(strongbox::schema::account_state<1>&& o, ::scale::Encoder& encoder);
void decode(strongbox::schema::account_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace strongbox::schema::encoding::scale
