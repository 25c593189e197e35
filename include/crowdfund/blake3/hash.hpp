#pragma once
#include <blake3.h>
#include <crowdfund/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace crowdfund::blake3 {

/// Incremental BLAKE3 hasher over the C reference implementation.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const crowdfund::schema::bytes_view_t& bytes);

  /// Produce the 32 byte digest. The hasher may keep absorbing afterwards.
  crowdfund::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

crowdfund::schema::hash32_t hash(const std::string_view& str);
crowdfund::schema::hash32_t hash(const crowdfund::schema::bytes_view_t& bytes);

}  // namespace crowdfund::blake3
