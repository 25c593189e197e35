#include <crowdfund/schema/encoding/scale/campaign.hpp>

using namespace crowdfund::schema;

namespace crowdfund::schema::encoding::scale {

void encode(campaign<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.description, encoder);
  encode(o.amount_donated, encoder);
  encode(o.admin, encoder);
}

void decode(campaign<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.description, decoder);
  decode(o.amount_donated, decoder);
  decode(o.admin, decoder);
}

}  // namespace crowdfund::schema::encoding::scale
