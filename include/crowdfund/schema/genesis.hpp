#pragma once
#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/rent.hpp>
#include <string>
#include <vector>

// Schema type: genesis.
// Crowdfund workflow: Initial ledger state: chain name, rent parameters and
// the funded wallets that exist before the first block.
namespace crowdfund::schema {

template <uint16_t Version>
struct genesis_account;

template <>
struct genesis_account<1> final {
  uint16_t version{1};
  pubkey_t owner{};
  lamports_t lamports{};
};

using genesis_account_t = genesis_account<1>;

template <uint16_t Version>
struct genesis;

template <>
struct genesis<1> final {
  uint16_t version{1};
  std::string chain_name{"crowdfund-local"};
  rent_t rent{};
  std::vector<genesis_account_t> accounts;
};

using genesis_t = genesis<1>;

}  // namespace crowdfund::schema
