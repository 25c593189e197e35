#pragma once
#include <crowdfund/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

// Schema type: campaign.
// Crowdfund workflow: The persisted crowdfunding record. Name and description
// are fixed at creation, admin is the creator and the only withdrawer.
namespace crowdfund::schema {

inline constexpr auto kCampaignNameCapacity = std::size_t{100};
inline constexpr auto kCampaignDescriptionCapacity = std::size_t{500};

template <uint16_t Version>
struct campaign;

template <>
struct campaign<1> final {
  uint16_t version{1};
  std::string name;
  std::string description;
  uint64_t amount_donated{};  // lifetime donations, not the live balance
  pubkey_t admin{};
};

using campaign_t = campaign<1>;

}  // namespace crowdfund::schema
