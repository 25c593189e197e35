#pragma once
#include <crowdfund/schema/primitives.hpp>

// Schema type: transfer.
// Crowdfund workflow: System level lamport transfer between wallets.
namespace crowdfund::schema {

template <uint16_t Version>
struct transfer;

template <>
struct transfer<1> final {
  uint16_t version{1};
  pubkey_t to{};
  lamports_t amount{};
};

using transfer_t = transfer<1>;

}  // namespace crowdfund::schema
