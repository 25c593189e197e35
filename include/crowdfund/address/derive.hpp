#pragma once
#include <crowdfund/schema/primitives.hpp>
#include <string_view>

namespace crowdfund::address {

/// Domain tag naming a creator's campaign record.
inline constexpr std::string_view kCampaignSeed{"campaign"};

/// Identity of the campaign program; owner of every campaign account.
const crowdfund::schema::program_id_t& program_id();

/// Deterministic storage location for (domain_tag, creator) under `program`.
///
/// Pure function: BLAKE3 over the length-prefixed tag, the creator key, the
/// program id and a fixed marker, so equal inputs always name the same account
/// and no index is needed to find it.
crowdfund::schema::address_t derive_address(
    std::string_view domain_tag,
    const crowdfund::schema::pubkey_t& creator,
    const crowdfund::schema::program_id_t& program);

/// derive_address under the campaign program.
crowdfund::schema::address_t derive_address(
    std::string_view domain_tag,
    const crowdfund::schema::pubkey_t& creator);

/// The single campaign address a creator may own.
crowdfund::schema::address_t campaign_address(
    const crowdfund::schema::pubkey_t& creator);

}  // namespace crowdfund::address
