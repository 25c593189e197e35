#include <crowdfund/schema/encoding/scale/genesis.hpp>
#include <crowdfund/schema/encoding/scale/genesis_account.hpp>
#include <crowdfund/schema/encoding/scale/rent.hpp>

using namespace crowdfund::schema;

namespace crowdfund::schema::encoding::scale {

void encode(genesis<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_name, encoder);
  encode(o.rent, encoder);
  encode(o.accounts, encoder);
}

void decode(genesis<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_name, decoder);
  decode(o.rent, decoder);
  decode(o.accounts, decoder);
}

}  // namespace crowdfund::schema::encoding::scale
