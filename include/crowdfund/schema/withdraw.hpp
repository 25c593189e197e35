#pragma once
#include <crowdfund/schema/primitives.hpp>

// Schema type: withdraw.
// Crowdfund workflow: Admin-only payout from a campaign to the signer, bounded
// by the campaign balance above its minimum reserve.
namespace crowdfund::schema {

template <uint16_t Version>
struct withdraw;

template <>
struct withdraw<1> final {
  uint16_t version{1};
  address_t campaign{};
  lamports_t amount{};
};

using withdraw_t = withdraw<1>;

}  // namespace crowdfund::schema
