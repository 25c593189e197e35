#pragma once

#include <crowdfund/execution/signature_verifier.hpp>
#include <crowdfund/runtime/error.hpp>
#include <crowdfund/schema/app_info.hpp>
#include <crowdfund/schema/block_result.hpp>
#include <crowdfund/schema/commit_result.hpp>
#include <crowdfund/schema/encoding/scale/encoder.hpp>
#include <crowdfund/schema/genesis.hpp>
#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/query_result.hpp>
#include <crowdfund/schema/rent.hpp>
#include <crowdfund/schema/transaction.hpp>
#include <crowdfund/schema/transaction_result.hpp>
#include <crowdfund/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace crowdfund::execution {

/// Deterministic single node ledger hosting the campaign program.
///
/// Every entry point takes the engine lock, so transactions never interleave.
/// A transaction runs against a private account overlay that is folded into
/// the block write set only when it succeeds; `commit` makes the block write
/// set durable in one storage batch.
class engine final {
 public:
  /// `require_strict_crypto` enables Ed25519 signature checks; when false,
  /// signatures are not verified (local development mode).
  explicit engine(
      crowdfund::schema::encoding::encoder<
          crowdfund::schema::encoding::scale_encoder_tag>& encoder,
      crowdfund::storage::storage<crowdfund::storage::rocksdb_storage_tag>&
          storage,
      bool require_strict_crypto = true);

  /// Seed an empty store with chain id, rent and funded wallets.
  std::optional<crowdfund::runtime::error> init_chain(
      const crowdfund::schema::genesis_t& genesis);

  /// Decode and validate envelope (version, chain id, nonce, signature).
  /// Never mutates state.
  crowdfund::schema::transaction_result_t check_transaction(
      const crowdfund::schema::bytes_view_t& raw_tx);

  /// Execute a block in order and compute its candidate state root.
  ///
  /// Per-transaction results are returned even on failures.
  crowdfund::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<crowdfund::schema::bytes_t>& txs);

  /// Persist the last finalized block and its (height, state_root).
  crowdfund::schema::commit_result_t commit();

  crowdfund::schema::app_info_t info() const;

  /// Read committed state by route.
  crowdfund::schema::query_result_t query(
      std::string_view path,
      const crowdfund::schema::bytes_view_t& data);

  /// Install signature verifier callback. Ignored when strict crypto is off.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  std::optional<crowdfund::runtime::error> validate_transaction(
      const crowdfund::schema::transaction_t& tx) const;

  crowdfund::schema::transaction_result_t execute_transaction(
      const crowdfund::schema::transaction_t& tx);

  std::optional<crowdfund::schema::bytes_t> read(
      const crowdfund::schema::bytes_view_t& key) const;
  std::optional<crowdfund::schema::account_t> read_account(
      const crowdfund::schema::address_t& address) const;
  uint64_t read_nonce(const crowdfund::schema::pubkey_t& signer) const;

  void load_persisted_state();

  mutable std::mutex mutex_;
  crowdfund::schema::encoding::encoder<
      crowdfund::schema::encoding::scale_encoder_tag>& encoder_;
  crowdfund::storage::storage<crowdfund::storage::rocksdb_storage_tag>&
      storage_;
  int64_t last_committed_height_{};
  crowdfund::schema::hash32_t last_committed_state_root_{};
  std::optional<int64_t> pending_height_;
  crowdfund::schema::hash32_t pending_state_root_{};
  std::map<crowdfund::schema::bytes_t, crowdfund::schema::bytes_t>
      pending_writes_;
  std::optional<crowdfund::schema::hash32_t> chain_id_;
  crowdfund::schema::rent_t rent_{};
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace crowdfund::execution
