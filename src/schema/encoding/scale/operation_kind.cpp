#include <strongbox/schema/encoding/scale/operation_kind.hpp>

using namespace strongbox::schema;

namespace strongbox::schema::encoding::scale {

void encode(operation_kind_t&& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(operation_kind_t&& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  o = static_cast<operation_kind_t>(raw);
}

}  // namespace strongbox::schema::encoding::scale
