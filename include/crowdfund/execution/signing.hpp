#pragma once

#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/transaction.hpp>

namespace crowdfund::execution {

/// Bytes a transaction signature covers: SCALE of
/// (version, chain_id, nonce, signer, payload).
crowdfund::schema::bytes_t signing_bytes(
    const crowdfund::schema::transaction_t& tx);

}  // namespace crowdfund::execution
