#include <crowdfund/blake3/hash.hpp>

namespace crowdfund::blake3 {

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const crowdfund::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

crowdfund::schema::hash32_t hasher::finalize() const {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<crowdfund::schema::hash32_t>);
  auto output = crowdfund::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

crowdfund::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

crowdfund::schema::hash32_t hash(const crowdfund::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace crowdfund::blake3
