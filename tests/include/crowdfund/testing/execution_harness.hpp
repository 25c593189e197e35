#pragma once

#include <gtest/gtest.h>

#include <crowdfund/execution/engine.hpp>
#include <crowdfund/execution/signing.hpp>
#include <crowdfund/crypto/verify.hpp>
#include <crowdfund/schema/encoding/scale/encoder.hpp>
#include <crowdfund/schema/layout/campaign.hpp>
#include <crowdfund/testing/common.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace crowdfund::testing {

using scale_encoder_t = crowdfund::schema::encoding::encoder<
    crowdfund::schema::encoding::scale_encoder_tag>;

inline crowdfund::schema::transaction_t make_transaction(
    const crowdfund::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const crowdfund::schema::pubkey_t& signer,
    const crowdfund::schema::transaction_payload_t& payload) {
  return crowdfund::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = crowdfund::schema::ed25519_signature_t{}};
}

inline void sign_transaction(
    crowdfund::schema::transaction_t& tx,
    const crowdfund::schema::ed25519_secret_key_t& secret_key) {
  const auto message = crowdfund::execution::signing_bytes(tx);
  const auto signature = crowdfund::crypto::sign_ed25519(
      crowdfund::schema::bytes_view_t{message.data(), message.size()},
      secret_key);
  ASSERT_TRUE(signature.has_value());
  tx.signature = *signature;
}

inline crowdfund::schema::bytes_t encode_transaction(
    const crowdfund::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

inline crowdfund::schema::hash32_t chain_id_from_engine(
    crowdfund::execution::engine& engine) {
  const auto query = engine.query("/engine/info", {});
  EXPECT_EQ(query.code, 0u);
  auto encoder = scale_encoder_t{};
  const auto decoded = encoder.decode<std::tuple<
      int64_t, crowdfund::schema::hash32_t, crowdfund::schema::hash32_t>>(
      crowdfund::schema::bytes_view_t{query.value.data(), query.value.size()});
  return std::get<2>(decoded);
}

/// Finalize a single transaction block at the next height and commit it.
inline crowdfund::schema::transaction_result_t finalize_single(
    crowdfund::execution::engine& engine,
    const crowdfund::schema::transaction_t& tx) {
  const auto height =
      static_cast<uint64_t>(engine.info().last_block_height) + 1;
  auto block = engine.finalize_block(height, {encode_transaction(tx)});
  EXPECT_EQ(block.tx_results.size(), 1u);
  engine.commit();
  return block.tx_results.front();
}

inline std::optional<crowdfund::schema::account_t> query_account(
    crowdfund::execution::engine& engine,
    const crowdfund::schema::address_t& address) {
  const auto result = engine.query(
      "/account",
      crowdfund::schema::bytes_view_t{address.data(), address.size()});
  if (result.code != 0) {
    return std::nullopt;
  }
  auto encoder = scale_encoder_t{};
  return encoder.decode<crowdfund::schema::account_t>(
      crowdfund::schema::bytes_view_t{result.value.data(), result.value.size()});
}

inline std::optional<crowdfund::schema::campaign_t> query_campaign(
    crowdfund::execution::engine& engine,
    const crowdfund::schema::address_t& address) {
  const auto result = engine.query(
      "/campaign",
      crowdfund::schema::bytes_view_t{address.data(), address.size()});
  if (result.code != 0) {
    return std::nullopt;
  }
  auto encoder = scale_encoder_t{};
  return encoder.decode<crowdfund::schema::campaign_t>(
      crowdfund::schema::bytes_view_t{result.value.data(), result.value.size()});
}

inline crowdfund::schema::lamports_t balance_of(
    crowdfund::execution::engine& engine,
    const crowdfund::schema::address_t& address) {
  const auto account = query_account(engine, address);
  return account ? account->lamports : 0;
}

inline uint64_t query_nonce(crowdfund::execution::engine& engine,
                            const crowdfund::schema::pubkey_t& signer) {
  const auto result = engine.query(
      "/nonce", crowdfund::schema::bytes_view_t{signer.data(), signer.size()});
  EXPECT_EQ(result.code, 0u);
  auto encoder = scale_encoder_t{};
  return encoder.decode<uint64_t>(
      crowdfund::schema::bytes_view_t{result.value.data(), result.value.size()});
}

}  // namespace crowdfund::testing
