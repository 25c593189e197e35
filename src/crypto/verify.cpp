#include <crowdfund/crypto/verify.hpp>

#include <openssl/evp.h>

#include <memory>

namespace crowdfund::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

std::optional<ed25519_keypair> keypair_of(EVP_PKEY* pkey) {
  auto keypair = ed25519_keypair{};
  auto secret_length = keypair.secret_key.size();
  auto public_length = keypair.public_key.size();
  if (EVP_PKEY_get_raw_private_key(pkey, keypair.secret_key.data(),
                                   &secret_length) != 1 ||
      EVP_PKEY_get_raw_public_key(pkey, keypair.public_key.data(),
                                  &public_length) != 1) {
    return std::nullopt;
  }
  if (secret_length != keypair.secret_key.size() ||
      public_length != keypair.public_key.size()) {
    return std::nullopt;
  }
  return keypair;
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519();
  return available_now;
}

std::optional<ed25519_keypair> generate_ed25519_keypair() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    return std::nullopt;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &raw_pkey) != 1) {
    return std::nullopt;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
  return keypair_of(pkey.get());
}

std::optional<ed25519_keypair> ed25519_keypair_from_secret(
    const crowdfund::schema::ed25519_secret_key_t& secret_key) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, secret_key.data(),
                                   secret_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return std::nullopt;
  }
  return keypair_of(pkey.get());
}

std::optional<crowdfund::schema::ed25519_signature_t> sign_ed25519(
    const crowdfund::schema::bytes_view_t& message,
    const crowdfund::schema::ed25519_secret_key_t& secret_key) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, secret_key.data(),
                                   secret_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return std::nullopt;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1) {
    return std::nullopt;
  }

  auto signature = crowdfund::schema::ed25519_signature_t{};
  auto signature_length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_length,
                     message.data(), message.size()) != 1 ||
      signature_length != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

bool verify_signature(const crowdfund::schema::bytes_view_t& message,
                      const crowdfund::schema::pubkey_t& signer,
                      const crowdfund::schema::ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.data(), signer.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

}  // namespace crowdfund::crypto
