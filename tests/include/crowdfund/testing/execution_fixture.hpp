#pragma once

#include <crowdfund/execution/engine.hpp>
#include <crowdfund/schema/genesis.hpp>
#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/storage/rocksdb/storage.hpp>
#include <crowdfund/testing/common.hpp>
#include <crowdfund/testing/execution_harness.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace crowdfund::testing {

/// Engine over a throwaway RocksDB directory, seeded with `genesis`.
class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix,
                             const crowdfund::schema::genesis_t& genesis,
                             const bool strict_crypto = false)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{crowdfund::storage::make_storage<
            crowdfund::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_, strict_crypto} {
    const auto error = engine_.init_chain(genesis);
    EXPECT_FALSE(error.has_value());
    chain_id_ = chain_id_from_engine(engine_);
  }

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }

  scale_encoder_t& encoder() { return encoder_; }

  crowdfund::storage::storage<crowdfund::storage::rocksdb_storage_tag>&
  storage() {
    return storage_;
  }

  crowdfund::execution::engine& engine() { return engine_; }

  const crowdfund::schema::hash32_t& chain_id() const { return chain_id_; }

  /// Next nonce for `signer`, read from committed state.
  uint64_t next_nonce(const crowdfund::schema::pubkey_t& signer) {
    return query_nonce(engine_, signer);
  }

  /// Build, finalize and commit a transaction with the signer's next nonce.
  crowdfund::schema::transaction_result_t submit(
      const crowdfund::schema::pubkey_t& signer,
      const crowdfund::schema::transaction_payload_t& payload) {
    return finalize_single(
        engine_,
        make_transaction(chain_id_, next_nonce(signer), signer, payload));
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  crowdfund::storage::storage<crowdfund::storage::rocksdb_storage_tag> storage_;
  crowdfund::execution::engine engine_;
  crowdfund::schema::hash32_t chain_id_{};
};

}  // namespace crowdfund::testing
