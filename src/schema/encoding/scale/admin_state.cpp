#include <strongbox/schema/encoding/scale/admin_state.hpp>

using namespace strongbox::schema;

namespace strongbox::schema::encoding::scale {

void encode(admin_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.oracle_address, encoder);
}

void decode(admin_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.oracle_address, decoder);
}

}  // namespace strongbox::schema::encoding::scale
