#pragma once
#include <crowdfund/schema/primitives.hpp>

// Schema type: donate.
// Crowdfund workflow: Moves lamports from the signer into a campaign and
// records them in the lifetime donation counter. Open to any signer.
namespace crowdfund::schema {

template <uint16_t Version>
struct donate;

template <>
struct donate<1> final {
  uint16_t version{1};
  address_t campaign{};
  lamports_t amount{};
};

using donate_t = donate<1>;

}  // namespace crowdfund::schema
