#pragma once
#include <strongbox/schema/admin_state.hpp>
#include <scale/scale.hpp>

namespace strongbox::schema::encoding::scale {

void encode(strongbox::schema::admin_state<1>&& o, ::scale::Encoder& encoder);
void decode(strongbox::schema::admin_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace strongbox::schema::encoding::scale
