#pragma once
#include <crowdfund/schema/campaign.hpp>
#include <crowdfund/schema/primitives.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

// On-account byte layout of a campaign record, little endian:
//   discriminator[8] | u32 len | name | u32 len | description |
//   u64 amount_donated | admin[32] | zero padding
// The account is allocated once at kCampaignAccountSize and never resized, so
// capacity is a bound on the total serialized size, not on each field.
namespace crowdfund::schema::layout {

using discriminator_t = std::array<uint8_t, 8>;

inline constexpr auto kDiscriminatorSize = std::tuple_size_v<discriminator_t>;
inline constexpr auto kLengthPrefixSize = std::size_t{4};
inline constexpr auto kCampaignAccountSize =
    kDiscriminatorSize + kLengthPrefixSize + kCampaignNameCapacity +
    kLengthPrefixSize + kCampaignDescriptionCapacity + sizeof(uint64_t) +
    std::tuple_size_v<pubkey_t>;

static_assert(kCampaignAccountSize == 656);

/// First 8 bytes of BLAKE3("account:Campaign").
const discriminator_t& campaign_discriminator();

/// Bytes `value` occupies when written, excluding padding.
std::size_t serialized_size(const campaign_t& value);

/// Write `value` over `account_data`, zero filling the remainder.
///
/// Returns false and leaves `account_data` untouched when the record does not
/// fit the account.
bool write(const campaign_t& value, bytes_t& account_data);

/// Read a campaign record, or std::nullopt when the bytes are not one.
std::optional<campaign_t> read(const bytes_view_t& account_data);

}  // namespace crowdfund::schema::layout
