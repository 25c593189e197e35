#include <crowdfund/schema/encoding/scale/create_campaign.hpp>

using namespace crowdfund::schema;

namespace crowdfund::schema::encoding::scale {

void encode(create_campaign<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.campaign, encoder);
  encode(o.name, encoder);
  encode(o.description, encoder);
}

void decode(create_campaign<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.campaign, decoder);
  decode(o.name, decoder);
  decode(o.description, decoder);
}

}  // namespace crowdfund::schema::encoding::scale
