#include <strongbox/schema/encoding/scale/ledger_config.hpp>

using namespace strongbox::schema;

namespace strongbox::schema::encoding::scale {

void encode(ledger_config<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.withdraw_limit, encoder);
  encode(o.bank_cap, encoder);
}

void decode(ledger_config<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.withdraw_limit, decoder);
  decode(o.bank_cap, decoder);
}

}  // namespace strongbox::schema::encoding::scale
