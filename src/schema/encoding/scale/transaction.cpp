#include <crowdfund/schema/encoding/scale/transaction.hpp>
#include <crowdfund/schema/encoding/scale/create_campaign.hpp>
#include <crowdfund/schema/encoding/scale/donate.hpp>
#include <crowdfund/schema/encoding/scale/withdraw.hpp>
#include <crowdfund/schema/encoding/scale/transfer.hpp>

using namespace crowdfund::schema;

namespace crowdfund::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace crowdfund::schema::encoding::scale
