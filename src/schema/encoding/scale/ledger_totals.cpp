#include <strongbox/schema/encoding/scale/ledger_totals.hpp>

using namespace strongbox::schema;

namespace strongbox::schema::encoding::scale {

void encode(ledger_totals<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.total_balance, encoder);
  encode(o.deposit_count, encoder);
  encode(o.withdrawal_count, encoder);
}

void decode(ledger_totals<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.total_balance, decoder);
  decode(o.deposit_count, decoder);
  decode(o.withdrawal_count, decoder);
}

}  // namespace strongbox::schema::encoding::scale
