#include <crowdfund/schema/encoding/scale/transfer.hpp>

using namespace crowdfund::schema;

namespace crowdfund::schema::encoding::scale {

void encode(transfer<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.to, encoder);
  encode(o.amount, encoder);
}

void decode(transfer<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.to, decoder);
  decode(o.amount, decoder);
}

}  // namespace crowdfund::schema::encoding::scale
