#pragma once
#include <rocksdb/db.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <crowdfund/common/critical.hpp>
#include <crowdfund/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace crowdfund::storage {

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const crowdfund::schema::bytes_view_t& key) const;

  std::optional<crowdfund::schema::bytes_t> get_raw(
      const crowdfund::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const crowdfund::schema::bytes_view_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      crowdfund::schema::bytes_view_t{raw->data(), raw->size()})};
}

}  // namespace crowdfund::storage
