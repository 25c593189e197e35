#pragma once
#include <crowdfund/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace crowdfund::storage {

using key_value_entry_t =
    std::pair<crowdfund::schema::bytes_t, crowdfund::schema::bytes_t>;

/// Last committed block checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  crowdfund::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const crowdfund::schema::bytes_view_t& key) const;

  /// Raw value at key, or std::nullopt when missing.
  std::optional<crowdfund::schema::bytes_t> get_raw(
      const crowdfund::schema::bytes_view_t& key) const;

  std::optional<committed_state> load_committed_state() const;

  /// Atomically write entries together with the new committed checkpoint.
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace crowdfund::storage
