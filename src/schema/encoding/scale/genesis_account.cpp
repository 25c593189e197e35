#include <crowdfund/schema/encoding/scale/genesis_account.hpp>

using namespace crowdfund::schema;

namespace crowdfund::schema::encoding::scale {

void encode(genesis_account<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.lamports, encoder);
}

void decode(genesis_account<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.lamports, decoder);
}

}  // namespace crowdfund::schema::encoding::scale
