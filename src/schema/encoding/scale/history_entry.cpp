#include <strongbox/schema/encoding/scale/history_entry.hpp>
#include <strongbox/schema/encoding/scale/operation_kind.hpp>

using namespace strongbox::schema;

namespace strongbox::schema::encoding::scale {

void encode(history_entry<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.kind, encoder);
  encode(o.index, encoder);
  encode(o.amount, encoder);
}

void decode(history_entry<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.kind, decoder);
  decode(o.index, decoder);
  decode(o.amount, decoder);
}

}  // namespace strongbox::schema::encoding::scale
