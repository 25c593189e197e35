#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <crowdfund/schema/encoding/scale/encoder.hpp>
#include <crowdfund/schema/key/engine_keys.hpp>
#include <crowdfund/storage/rocksdb/storage.hpp>
#include <tuple>

namespace crowdfund::storage {

namespace {

using encoder_t = crowdfund::schema::encoding::encoder<
    crowdfund::schema::encoding::scale_encoder_tag>;

ROCKSDB_NAMESPACE::Slice to_slice(const crowdfund::schema::bytes_view_t& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

void require_open(const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    crowdfund::common::critical("RocksDB database is not initialized");
  }
}

crowdfund::schema::bytes_t encode_committed_state(
    const committed_state& state) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{state.height, state.state_root});
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    crowdfund::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened ledger store at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<crowdfund::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const crowdfund::schema::bytes_view_t& key) const {
  require_open(database);
  auto value = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    crowdfund::common::critical("Failed to get value from RocksDB");
  }
  return crowdfund::schema::bytes_t(std::begin(value), std::end(value));
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_raw(crowdfund::schema::make_bytes_view(
      crowdfund::schema::key::kCommittedStateKey));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, crowdfund::schema::hash32_t>>(
          crowdfund::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    crowdfund::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  require_open(database);

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(to_slice(key), to_slice(value));
    if (!put_status.ok()) {
      crowdfund::common::critical("failed staging key in commit batch");
    }
  }

  auto encoded_state = encode_committed_state(state);
  auto state_status = batch.Put(
      to_slice(crowdfund::schema::make_bytes_view(
          crowdfund::schema::key::kCommittedStateKey)),
      to_slice(encoded_state));
  if (!state_status.ok()) {
    crowdfund::common::critical("failed staging committed state");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("RocksDB commit failed: {}", write_status.ToString());
    crowdfund::common::critical("failed to commit block");
  }
}

}  // namespace crowdfund::storage
