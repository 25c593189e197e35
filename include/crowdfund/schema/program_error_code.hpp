#pragma once

#include <crowdfund/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: program error code.
// Crowdfund workflow: The only failures the campaign program defines itself;
// everything else surfaces as a runtime error.
namespace crowdfund::schema {

enum class program_error_code : uint32_t {
  unauthorized = 6000,
  insufficient_funds = 6001,
};

inline constexpr auto kProgramErrorCodeMappings =
    std::array{std::pair<std::string_view, program_error_code>{
                   "unauthorized", program_error_code::unauthorized},
               std::pair<std::string_view, program_error_code>{
                   "insufficient_funds", program_error_code::insufficient_funds}};

template <>
inline std::optional<program_error_code> try_from_string<program_error_code>(
    const std::string_view value) {
  return from_string(value, kProgramErrorCodeMappings);
}

inline constexpr std::string_view to_string(const program_error_code value) {
  return to_string(value, kProgramErrorCodeMappings).value_or("unknown");
}

/// Human readable message reported with the error.
inline constexpr std::string_view message(const program_error_code value) {
  switch (value) {
    case program_error_code::unauthorized:
      return "You are not authorized to perform this action.";
    case program_error_code::insufficient_funds:
      return "Not enough funds in the campaign account.";
  }
  return "Unknown program error.";
}

}  // namespace crowdfund::schema
