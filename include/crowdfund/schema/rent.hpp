#pragma once
#include <crowdfund/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

// Schema type: rent.
// Crowdfund workflow: Parameters of the minimum reserve an account must hold
// for the bytes it occupies.
namespace crowdfund::schema {

template <uint16_t Version>
struct rent;

template <>
struct rent<1> final {
  uint16_t version{1};
  lamports_t lamports_per_byte_year{3480};
  uint64_t exemption_threshold_years{2};
  uint64_t account_storage_overhead{128};

  /// Smallest balance an account with `data_size` bytes of data must keep.
  /// Empty when the reserve does not fit in a u64.
  constexpr std::optional<lamports_t> minimum_balance(
      const std::size_t data_size) const {
    constexpr auto kMax = std::numeric_limits<uint64_t>::max();
    const auto size = static_cast<uint64_t>(data_size);
    if (size > kMax - account_storage_overhead) {
      return std::nullopt;
    }
    auto total = account_storage_overhead + size;
    if (lamports_per_byte_year != 0 && total > kMax / lamports_per_byte_year) {
      return std::nullopt;
    }
    total *= lamports_per_byte_year;
    if (exemption_threshold_years != 0 &&
        total > kMax / exemption_threshold_years) {
      return std::nullopt;
    }
    total *= exemption_threshold_years;
    return total;
  }
};

using rent_t = rent<1>;

}  // namespace crowdfund::schema
