#include <strongbox/schema/encoding/scale/journal_record.hpp>
#include <strongbox/schema/encoding/scale/operation_kind.hpp>

using namespace strongbox::schema;

namespace strongbox::schema::encoding::scale {

void encode(journal_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.kind, encoder);
  encode(o.account, encoder);
  encode(o.amount, encoder);
}

void decode(journal_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.kind, decoder);
  decode(o.account, decoder);
  decode(o.amount, decoder);
}

}  // namespace strongbox::schema::encoding::scale
