#include <boost/endian/buffers.hpp>
#include <crowdfund/address/derive.hpp>
#include <crowdfund/blake3/hash.hpp>

namespace crowdfund::address {

namespace {

constexpr auto kDerivedAddressMarker = std::string_view{"ProgramDerivedAddress"};

}  // namespace

const crowdfund::schema::program_id_t& program_id() {
  static const auto id =
      crowdfund::blake3::hash(std::string_view{"crowdfund.program.campaign.v1"});
  return id;
}

crowdfund::schema::address_t derive_address(
    std::string_view domain_tag,
    const crowdfund::schema::pubkey_t& creator,
    const crowdfund::schema::program_id_t& program) {
  auto tag_length =
      boost::endian::little_uint32_buf_t{static_cast<uint32_t>(domain_tag.size())};
  auto hasher = crowdfund::blake3::hasher{};
  hasher.update(crowdfund::schema::bytes_view_t{tag_length.data(),
                                                sizeof(tag_length)})
      .update(domain_tag)
      .update(crowdfund::schema::bytes_view_t{creator.data(), creator.size()})
      .update(crowdfund::schema::bytes_view_t{program.data(), program.size()})
      .update(kDerivedAddressMarker);
  return hasher.finalize();
}

crowdfund::schema::address_t derive_address(
    std::string_view domain_tag,
    const crowdfund::schema::pubkey_t& creator) {
  return derive_address(domain_tag, creator, program_id());
}

crowdfund::schema::address_t campaign_address(
    const crowdfund::schema::pubkey_t& creator) {
  return derive_address(kCampaignSeed, creator);
}

}  // namespace crowdfund::address
