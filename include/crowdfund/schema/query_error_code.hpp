#pragma once

#include <cstdint>

// Schema type: query error code.
// Crowdfund workflow: Read-path failures reported under the crowdfund.query
// codespace.
namespace crowdfund::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  invalid_account_data = 3,
  unsupported_path = 4,
};

}  // namespace crowdfund::schema
