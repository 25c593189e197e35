#pragma once
#include <crowdfund/schema/program_error_code.hpp>
#include <crowdfund/schema/transaction_error_code.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace crowdfund::runtime {

inline constexpr auto kRuntimeCodespace = std::string_view{"crowdfund.runtime"};
inline constexpr auto kProgramCodespace = std::string_view{"crowdfund.program"};

/// Failure of a single invocation. Any error discards the invocation's writes.
struct error final {
  uint32_t code{};
  std::string codespace;
  std::string message;
};

inline error make_runtime_error(const crowdfund::schema::transaction_error_code code,
                                std::string message) {
  return error{.code = static_cast<uint32_t>(code),
               .codespace = std::string{kRuntimeCodespace},
               .message = std::move(message)};
}

inline error make_program_error(const crowdfund::schema::program_error_code code) {
  return error{.code = static_cast<uint32_t>(code),
               .codespace = std::string{kProgramCodespace},
               .message = std::string{crowdfund::schema::message(code)}};
}

}  // namespace crowdfund::runtime
