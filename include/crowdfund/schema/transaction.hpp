#pragma once
#include <crowdfund/schema/create_campaign.hpp>
#include <crowdfund/schema/donate.hpp>
#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/transfer.hpp>
#include <crowdfund/schema/withdraw.hpp>
#include <variant>

namespace crowdfund::schema {

using transaction_payload_t =
    std::variant<create_campaign_t, donate_t, withdraw_t, transfer_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  pubkey_t signer{};
  transaction_payload_t payload{};
  ed25519_signature_t signature{};
};

using transaction_t = transaction<1>;

}  // namespace crowdfund::schema
