#pragma once

#include <crowdfund/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace crowdfund::schema {

/// Envelope and host runtime failures, reported under `crowdfund.runtime`.
enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  signature_verification_failed = 5,
  chain_not_initialized = 6,
  chain_already_initialized = 7,
  account_already_in_use = 10,
  account_not_found = 11,
  insufficient_lamports = 12,
  account_data_too_small = 13,
  invalid_account_owner = 14,
  invalid_account_data = 15,
  constraint_seeds = 16,
  arithmetic_overflow = 17,
  transfer_from_data_account = 18,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    std::pair<std::string_view, transaction_error_code>{
        "invalid_transaction", transaction_error_code::invalid_transaction},
    std::pair<std::string_view, transaction_error_code>{
        "unsupported_transaction_version",
        transaction_error_code::unsupported_transaction_version},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_chain_id", transaction_error_code::invalid_chain_id},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_nonce", transaction_error_code::invalid_nonce},
    std::pair<std::string_view, transaction_error_code>{
        "signature_verification_failed",
        transaction_error_code::signature_verification_failed},
    std::pair<std::string_view, transaction_error_code>{
        "chain_not_initialized", transaction_error_code::chain_not_initialized},
    std::pair<std::string_view, transaction_error_code>{
        "chain_already_initialized",
        transaction_error_code::chain_already_initialized},
    std::pair<std::string_view, transaction_error_code>{
        "account_already_in_use",
        transaction_error_code::account_already_in_use},
    std::pair<std::string_view, transaction_error_code>{
        "account_not_found", transaction_error_code::account_not_found},
    std::pair<std::string_view, transaction_error_code>{
        "insufficient_lamports", transaction_error_code::insufficient_lamports},
    std::pair<std::string_view, transaction_error_code>{
        "account_data_too_small",
        transaction_error_code::account_data_too_small},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_account_owner", transaction_error_code::invalid_account_owner},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_account_data", transaction_error_code::invalid_account_data},
    std::pair<std::string_view, transaction_error_code>{
        "constraint_seeds", transaction_error_code::constraint_seeds},
    std::pair<std::string_view, transaction_error_code>{
        "arithmetic_overflow", transaction_error_code::arithmetic_overflow},
    std::pair<std::string_view, transaction_error_code>{
        "transfer_from_data_account",
        transaction_error_code::transfer_from_data_account}};

inline constexpr std::string_view to_string(const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown");
}

}  // namespace crowdfund::schema
