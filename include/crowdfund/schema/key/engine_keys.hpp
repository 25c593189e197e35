#pragma once

#include <crowdfund/schema/primitives.hpp>
#include <string_view>

// Schema key type: engine keys.
// Crowdfund workflow: Canonical key prefixes for ledger state and engine
// bookkeeping. Every persisted row lives under exactly one of these.
namespace crowdfund::schema::key {

inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kChainIdKey{"SYS|APP|CHAIN_ID"};
inline constexpr std::string_view kRentKey{"SYS|APP|RENT"};
inline constexpr std::string_view kCommittedStateKey{"SYS|APP|COMMITTED"};

bytes_t make_prefixed_key(std::string_view prefix, const bytes_view_t& id);
bytes_t make_system_key(std::string_view key);
bytes_t make_account_key(const address_t& address);
bytes_t make_nonce_key(const pubkey_t& signer);

}  // namespace crowdfund::schema::key
