#pragma once
#include <crowdfund/schema/primitives.hpp>
#include <string>

// Schema type: create campaign.
// Crowdfund workflow: Allocates the signer's campaign record at its derived
// address; the signer pays the minimum reserve and becomes admin.
namespace crowdfund::schema {

template <uint16_t Version>
struct create_campaign;

template <>
struct create_campaign<1> final {
  uint16_t version{1};
  address_t campaign{};  // must equal the signer's derived campaign address
  std::string name;
  std::string description;
};

using create_campaign_t = create_campaign<1>;

}  // namespace crowdfund::schema
