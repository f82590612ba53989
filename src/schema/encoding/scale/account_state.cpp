#include <strongbox/schema/encoding/scale/account_state.hpp>

using namespace strongbox::schema;

namespace strongbox::schema::encoding::scale {

void encode(account_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.balance, encoder);
}

void decode(account_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.balance, decoder);
}

}  // namespace strongbox::schema::encoding::scale
