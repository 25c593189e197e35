#pragma once
#include <crowdfund/common/critical.hpp>
#include <crowdfund/schema/encoding/encoder.hpp>
#include <crowdfund/schema/encoding/scale/account.hpp>
#include <crowdfund/schema/encoding/scale/campaign.hpp>
#include <crowdfund/schema/encoding/scale/create_campaign.hpp>
#include <crowdfund/schema/encoding/scale/donate.hpp>
#include <crowdfund/schema/encoding/scale/genesis.hpp>
#include <crowdfund/schema/encoding/scale/genesis_account.hpp>
#include <crowdfund/schema/encoding/scale/rent.hpp>
#include <crowdfund/schema/encoding/scale/transaction.hpp>
#include <crowdfund/schema/encoding/scale/transaction_event.hpp>
#include <crowdfund/schema/encoding/scale/transaction_event_attribute.hpp>
#include <crowdfund/schema/encoding/scale/transaction_result.hpp>
#include <crowdfund/schema/encoding/scale/transfer.hpp>
#include <crowdfund/schema/encoding/scale/withdraw.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace crowdfund::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  crowdfund::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, crowdfund::schema::bytes_t& out);

  template <typename T>
  T decode(const crowdfund::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const crowdfund::schema::bytes_view_t& bytes);
};

template <typename T>
crowdfund::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    crowdfund::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        crowdfund::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const crowdfund::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    crowdfund::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const crowdfund::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace crowdfund::schema::encoding
