#include <crowdfund/schema/encoding/scale/withdraw.hpp>

using namespace crowdfund::schema;

namespace crowdfund::schema::encoding::scale {

void encode(withdraw<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.campaign, encoder);
  encode(o.amount, encoder);
}

void decode(withdraw<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.campaign, decoder);
  decode(o.amount, decoder);
}

}  // namespace crowdfund::schema::encoding::scale
