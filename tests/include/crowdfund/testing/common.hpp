#pragma once

#include <crowdfund/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace crowdfund::testing {

inline crowdfund::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = crowdfund::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline crowdfund::schema::pubkey_t make_pubkey(const uint8_t seed) {
  auto key = crowdfund::schema::pubkey_t{};
  key[0] = seed;
  key[31] = 0xA5;
  return key;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace crowdfund::testing
