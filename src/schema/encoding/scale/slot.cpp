#include <verdict/schema/encoding/scale/slot.hpp>

using namespace verdict::schema;

namespace verdict::schema::encoding::scale {

void encode(slot<1>&& o, ::scale::Encoder& encoder) {
  encode(o.lamports, encoder);
  encode(o.owner, encoder);
  encode(o.data, encoder);
}

void decode(slot<1>&& o, ::scale::Decoder& decoder) {
  decode(o.lamports, decoder);
  decode(o.owner, decoder);
  decode(o.data, decoder);
}

}  // namespace verdict::schema::encoding::scale
