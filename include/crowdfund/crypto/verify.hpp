#pragma once

#include <crowdfund/schema/primitives.hpp>
#include <optional>

namespace crowdfund::crypto {

struct ed25519_keypair final {
  crowdfund::schema::ed25519_secret_key_t secret_key{};
  crowdfund::schema::pubkey_t public_key{};
};

/// True when the linked OpenSSL provides Ed25519.
bool available();

std::optional<ed25519_keypair> generate_ed25519_keypair();

/// Rebuild the keypair of a 32 byte Ed25519 seed.
std::optional<ed25519_keypair> ed25519_keypair_from_secret(
    const crowdfund::schema::ed25519_secret_key_t& secret_key);

std::optional<crowdfund::schema::ed25519_signature_t> sign_ed25519(
    const crowdfund::schema::bytes_view_t& message,
    const crowdfund::schema::ed25519_secret_key_t& secret_key);

bool verify_signature(const crowdfund::schema::bytes_view_t& message,
                      const crowdfund::schema::pubkey_t& signer,
                      const crowdfund::schema::ed25519_signature_t& signature);

}  // namespace crowdfund::crypto
