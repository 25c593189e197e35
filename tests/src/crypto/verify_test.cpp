#include <crowdfund/crypto/verify.hpp>
#include <gtest/gtest.h>

#include <vector>

namespace {

crowdfund::schema::bytes_t make_message() {
  return crowdfund::schema::bytes_t{'d', 'o', 'n', 'a', 't', 'e'};
}

}  // namespace

TEST(crypto_verify, ed25519_sign_then_verify) {
  if (!crowdfund::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in linked OpenSSL";
  }
  auto keypair = crowdfund::crypto::generate_ed25519_keypair();
  ASSERT_TRUE(keypair.has_value());
  auto message = make_message();
  auto signature = crowdfund::crypto::sign_ed25519(
      crowdfund::schema::bytes_view_t{message.data(), message.size()},
      keypair->secret_key);
  ASSERT_TRUE(signature.has_value());
  EXPECT_TRUE(crowdfund::crypto::verify_signature(
      crowdfund::schema::bytes_view_t{message.data(), message.size()},
      keypair->public_key, *signature));
}

TEST(crypto_verify, ed25519_rejects_tampered_message_and_foreign_key) {
  if (!crowdfund::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in linked OpenSSL";
  }
  auto keypair = crowdfund::crypto::generate_ed25519_keypair();
  auto other = crowdfund::crypto::generate_ed25519_keypair();
  ASSERT_TRUE(keypair.has_value());
  ASSERT_TRUE(other.has_value());
  auto message = make_message();
  auto signature = crowdfund::crypto::sign_ed25519(
      crowdfund::schema::bytes_view_t{message.data(), message.size()},
      keypair->secret_key);
  ASSERT_TRUE(signature.has_value());

  EXPECT_FALSE(crowdfund::crypto::verify_signature(
      crowdfund::schema::bytes_view_t{message.data(), message.size()},
      other->public_key, *signature));

  message.back() = 'x';
  EXPECT_FALSE(crowdfund::crypto::verify_signature(
      crowdfund::schema::bytes_view_t{message.data(), message.size()},
      keypair->public_key, *signature));
}

TEST(crypto_verify, keypair_from_secret_matches_generated_public_key) {
  if (!crowdfund::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in linked OpenSSL";
  }
  auto keypair = crowdfund::crypto::generate_ed25519_keypair();
  ASSERT_TRUE(keypair.has_value());
  auto rebuilt = crowdfund::crypto::ed25519_keypair_from_secret(keypair->secret_key);
  ASSERT_TRUE(rebuilt.has_value());
  EXPECT_EQ(rebuilt->public_key, keypair->public_key);
}

TEST(crypto_verify, zero_signature_is_rejected) {
  auto message = make_message();
  EXPECT_FALSE(crowdfund::crypto::verify_signature(
      crowdfund::schema::bytes_view_t{message.data(), message.size()},
      crowdfund::schema::pubkey_t{}, crowdfund::schema::ed25519_signature_t{}));
}
