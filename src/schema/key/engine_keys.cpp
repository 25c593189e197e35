#include <crowdfund/schema/key/engine_keys.hpp>

#include <iterator>

namespace crowdfund::schema::key {

bytes_t make_prefixed_key(std::string_view prefix, const bytes_view_t& id) {
  auto key = crowdfund::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

bytes_t make_system_key(std::string_view key) {
  return crowdfund::schema::make_bytes(key);
}

bytes_t make_account_key(const address_t& address) {
  return make_prefixed_key(kAccountKeyPrefix,
                           bytes_view_t{address.data(), address.size()});
}

bytes_t make_nonce_key(const pubkey_t& signer) {
  return make_prefixed_key(kNonceKeyPrefix,
                           bytes_view_t{signer.data(), signer.size()});
}

}  // namespace crowdfund::schema::key
