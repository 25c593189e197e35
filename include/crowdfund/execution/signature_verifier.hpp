#pragma once

#include <crowdfund/schema/primitives.hpp>
#include <functional>

namespace crowdfund::execution {

using signature_verifier_t =
    std::function<bool(const crowdfund::schema::bytes_view_t& message,
                       const crowdfund::schema::pubkey_t& signer,
                       const crowdfund::schema::ed25519_signature_t& signature)>;

}  // namespace crowdfund::execution
