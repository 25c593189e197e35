#pragma once

#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

// Schema type: block result.
// Crowdfund workflow: Finalize output: returns per-transaction results plus
// candidate post-block state root.
namespace crowdfund::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  std::vector<transaction_result_t> tx_results;
  hash32_t state_root;
};

using block_result_t = block_result<1>;

}  // namespace crowdfund::schema
