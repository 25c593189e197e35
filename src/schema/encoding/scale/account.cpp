#include <crowdfund/schema/encoding/scale/account.hpp>

using namespace crowdfund::schema;

namespace crowdfund::schema::encoding::scale {

void encode(account<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.lamports, encoder);
  encode(o.owner, encoder);
  encode(o.data, encoder);
}

void decode(account<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.lamports, decoder);
  decode(o.owner, decoder);
  decode(o.data, decoder);
}

}  // namespace crowdfund::schema::encoding::scale
