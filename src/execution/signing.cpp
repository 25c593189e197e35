#include <crowdfund/execution/signing.hpp>
#include <crowdfund/schema/encoding/scale/encoder.hpp>
#include <tuple>

namespace crowdfund::execution {

crowdfund::schema::bytes_t signing_bytes(
    const crowdfund::schema::transaction_t& tx) {
  auto encoder = crowdfund::schema::encoding::encoder<
      crowdfund::schema::encoding::scale_encoder_tag>{};
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

}  // namespace crowdfund::execution
