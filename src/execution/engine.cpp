#include <spdlog/spdlog.h>
#include <algorithm>
#include <crowdfund/address/derive.hpp>
#include <crowdfund/blake3/hash.hpp>
#include <crowdfund/crypto/verify.hpp>
#include <crowdfund/execution/engine.hpp>
#include <crowdfund/execution/signing.hpp>
#include <crowdfund/program/campaign_program.hpp>
#include <crowdfund/runtime/account_store.hpp>
#include <crowdfund/runtime/invocation_context.hpp>
#include <crowdfund/schema/key/engine_keys.hpp>
#include <crowdfund/schema/layout/campaign.hpp>
#include <crowdfund/schema/query_error_code.hpp>
#include <iterator>
#include <limits>
#include <tuple>
#include <utility>

using namespace crowdfund::schema;

namespace {

using encoder_t = crowdfund::schema::encoding::encoder<
    crowdfund::schema::encoding::scale_encoder_tag>;

constexpr auto kQueryCodespace = std::string_view{"crowdfund.query"};

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint64_t index) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  encoder.encode(std::tuple{height, index}, material);
  return crowdfund::blake3::hash(bytes_view_t{material.data(), material.size()});
}

transaction_result_t make_error_result(const crowdfund::runtime::error& error) {
  auto result = transaction_result_t{};
  result.code = error.code;
  result.log = error.message;
  result.codespace = error.codespace;
  return result;
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       std::string message) {
  return make_error_result(
      crowdfund::runtime::make_runtime_error(code, std::move(message)));
}

std::optional<hash32_t> hash32_from_key(const bytes_view_t& key) {
  if (key.size() != std::tuple_size_v<hash32_t>) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(std::begin(key), std::end(key), std::begin(hash));
  return hash;
}

query_result_t make_query_error(const query_error_code code, std::string log) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

std::string join_lines(const std::vector<std::string>& lines) {
  auto joined = std::string{};
  for (const auto& line : lines) {
    if (!joined.empty()) {
      joined.push_back('\n');
    }
    joined.append(line);
  }
  return joined;
}

}  // namespace

namespace crowdfund::execution {

engine::engine(
    crowdfund::schema::encoding::encoder<
        crowdfund::schema::encoding::scale_encoder_tag>& encoder,
    crowdfund::storage::storage<crowdfund::storage::rocksdb_storage_tag>&
        storage,
    bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      require_strict_crypto_{require_strict_crypto} {
  auto lock = std::scoped_lock{mutex_};
  if (require_strict_crypto_) {
    if (!crowdfund::crypto::available()) {
      crowdfund::common::critical(
          "strict crypto requested but Ed25519 is unavailable");
    }
    signature_verifier_ = crowdfund::crypto::verify_signature;
  } else {
    spdlog::warn("Strict crypto disabled; signatures are not verified");
  }
  load_persisted_state();
  spdlog::info("Execution engine ready at height {}", last_committed_height_);
}

std::optional<crowdfund::runtime::error> engine::init_chain(
    const genesis_t& genesis) {
  auto lock = std::scoped_lock{mutex_};
  if (chain_id_.has_value() || last_committed_height_ != 0) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::chain_already_initialized,
        "chain already initialized");
  }

  auto balances = std::map<pubkey_t, lamports_t>{};
  for (const auto& account : genesis.accounts) {
    auto& balance = balances[account.owner];
    if (balance > std::numeric_limits<lamports_t>::max() - account.lamports) {
      return crowdfund::runtime::make_runtime_error(
          transaction_error_code::arithmetic_overflow,
          "genesis balance overflow for " + to_hex(account.owner));
    }
    balance += account.lamports;
  }

  auto chain_id = crowdfund::blake3::hash(std::string_view{genesis.chain_name});
  auto entries = std::vector<crowdfund::storage::key_value_entry_t>{};
  entries.emplace_back(key::make_system_key(key::kChainIdKey),
                       encoder_.encode(chain_id));
  entries.emplace_back(key::make_system_key(key::kRentKey),
                       encoder_.encode(genesis.rent));
  for (const auto& [owner, lamports] : balances) {
    entries.emplace_back(
        key::make_account_key(owner),
        encoder_.encode(account_t{.lamports = lamports,
                                  .owner = kSystemProgramId}));
  }

  storage_.commit(entries, crowdfund::storage::committed_state{
                               .height = 0, .state_root = make_zero_hash()});
  chain_id_ = chain_id;
  rent_ = genesis.rent;
  last_committed_height_ = 0;
  last_committed_state_root_ = make_zero_hash();
  spdlog::info("Initialized chain '{}' ({}) with {} funded account(s)",
               genesis.chain_name, to_hex(chain_id), balances.size());
  return std::nullopt;
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto maybe_tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction");
  }
  if (auto error = validate_transaction(*maybe_tx)) {
    return make_error_result(*error);
  }
  return transaction_result_t{};
}

block_result_t engine::finalize_block(uint64_t height,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_.has_value()) {
    spdlog::warn("Discarding uncommitted block at height {}", *pending_height_);
  }
  pending_writes_.clear();

  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto maybe_tx = encoder_.try_decode<transaction_t>(
        bytes_view_t{txs[i].data(), txs[i].size()});
    if (!maybe_tx) {
      result.tx_results.push_back(make_error_result(
          transaction_error_code::invalid_transaction, "invalid transaction"));
      continue;
    }
    auto tx_result = execute_transaction(*maybe_tx);
    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    } else {
      spdlog::debug("Transaction {} at height {} failed: [{}:{}] {}", i,
                    height, tx_result.codespace, tx_result.code, tx_result.log);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_.has_value()) {
    auto entries = std::vector<crowdfund::storage::key_value_entry_t>{
        std::begin(pending_writes_), std::end(pending_writes_)};
    storage_.commit(entries, crowdfund::storage::committed_state{
                                 .height = *pending_height_,
                                 .state_root = pending_state_root_});
    last_committed_height_ = *pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_.reset();
    pending_writes_.clear();
    spdlog::debug("Committed height {} with {} write(s)",
                  last_committed_height_, entries.size());
  }

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  result.chain_id = chain_id_.value_or(make_zero_hash());
  return result;
}

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{last_committed_height_,
                                              last_committed_state_root_,
                                              chain_id_.value_or(make_zero_hash())});
    return result;
  }

  if (path == "/rent/minimum_balance") {
    auto size = encoder_.try_decode<uint64_t>(data);
    if (!size) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE u64 account size");
    }
    auto reserve = rent_.minimum_balance(*size);
    if (!reserve) {
      return make_query_error(query_error_code::invalid_key,
                              "account size overflows the rent reserve");
    }
    result.value = encoder_.encode(*reserve);
    return result;
  }

  auto id = hash32_from_key(data);
  if (!id) {
    return make_query_error(query_error_code::invalid_key,
                            "expected 32 byte key");
  }

  if (path == "/campaign/address") {
    result.value = encoder_.encode(crowdfund::address::campaign_address(*id));
    return result;
  }
  if (path == "/nonce") {
    auto nonce = storage_.get<encoder_t, uint64_t>(
        encoder_, key::make_nonce_key(*id));
    result.value = encoder_.encode(nonce.value_or(uint64_t{0}));
    return result;
  }

  auto account = storage_.get<encoder_t, account_t>(
      encoder_, key::make_account_key(*id));
  if (path == "/account") {
    if (!account) {
      return make_query_error(query_error_code::not_found,
                              "account not found");
    }
    result.value = encoder_.encode(*account);
    return result;
  }
  if (path == "/campaign") {
    if (!account || account->owner != crowdfund::address::program_id()) {
      return make_query_error(query_error_code::not_found,
                              "campaign not found");
    }
    auto campaign = layout::read(
        bytes_view_t{account->data.data(), account->data.size()});
    if (!campaign) {
      return make_query_error(query_error_code::invalid_account_data,
                              "account does not hold a campaign record");
    }
    result.value = encoder_.encode(*campaign);
    return result;
  }

  return make_query_error(query_error_code::unsupported_path,
                          "unknown query path '" + std::string{path} + "'");
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!require_strict_crypto_) {
    spdlog::debug("Ignoring signature verifier; strict crypto is off");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

std::optional<crowdfund::runtime::error> engine::validate_transaction(
    const transaction_t& tx) const {
  if (tx.version != 1) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::unsupported_transaction_version,
        "expected transaction version 1");
  }
  if (!chain_id_.has_value()) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::chain_not_initialized,
        "chain has no genesis");
  }
  if (tx.chain_id != *chain_id_) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::invalid_chain_id, "chain id mismatch");
  }
  auto expected_nonce = read_nonce(tx.signer);
  if (tx.nonce != expected_nonce) {
    return crowdfund::runtime::make_runtime_error(
        transaction_error_code::invalid_nonce,
        fmt::format("expected nonce {}, got {}", expected_nonce, tx.nonce));
  }
  if (require_strict_crypto_) {
    auto message = signing_bytes(tx);
    if (!signature_verifier_ ||
        !signature_verifier_(bytes_view_t{message.data(), message.size()},
                             tx.signer, tx.signature)) {
      return crowdfund::runtime::make_runtime_error(
          transaction_error_code::signature_verification_failed,
          "signature verification failed");
    }
  }
  return std::nullopt;
}

transaction_result_t engine::execute_transaction(const transaction_t& tx) {
  if (auto error = validate_transaction(tx)) {
    return make_error_result(*error);
  }

  auto accounts = crowdfund::runtime::account_store{
      rent_, [this](const address_t& address) { return read_account(address); }};
  auto context = crowdfund::runtime::invocation_context{accounts};
  auto error = std::visit(
      overloaded{
          [&](const create_campaign_t& instruction) {
            return crowdfund::program::create(context, tx.signer, instruction);
          },
          [&](const donate_t& instruction) {
            return crowdfund::program::donate(context, tx.signer, instruction);
          },
          [&](const withdraw_t& instruction) {
            return crowdfund::program::withdraw(context, tx.signer,
                                                instruction);
          },
          [&](const transfer_t& instruction) {
            return accounts.transfer(tx.signer, instruction.to,
                                     instruction.amount);
          }},
      tx.payload);

  if (error) {
    auto result = make_error_result(*error);
    if (!context.logs.empty()) {
      result.info = join_lines(context.logs);
    }
    return result;
  }

  for (const auto& [address, account] : accounts.changes()) {
    pending_writes_[key::make_account_key(address)] = encoder_.encode(account);
  }
  pending_writes_[key::make_nonce_key(tx.signer)] = encoder_.encode(tx.nonce + 1);

  auto result = transaction_result_t{};
  result.log = join_lines(context.logs);
  result.events = std::move(context.events);
  return result;
}

std::optional<bytes_t> engine::read(const bytes_view_t& key) const {
  if (auto it = pending_writes_.find(make_bytes(key));
      it != std::end(pending_writes_)) {
    return it->second;
  }
  return storage_.get_raw(key);
}

std::optional<account_t> engine::read_account(const address_t& address) const {
  auto raw = read(key::make_account_key(address));
  if (!raw) {
    return std::nullopt;
  }
  return encoder_.decode<account_t>(bytes_view_t{raw->data(), raw->size()});
}

uint64_t engine::read_nonce(const pubkey_t& signer) const {
  auto raw = read(key::make_nonce_key(signer));
  if (!raw) {
    return 0;
  }
  return encoder_.decode<uint64_t>(bytes_view_t{raw->data(), raw->size()});
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  } else {
    last_committed_state_root_ = make_zero_hash();
  }
  chain_id_ = storage_.get<encoder_t, hash32_t>(
      encoder_, key::make_system_key(key::kChainIdKey));
  if (auto rent = storage_.get<encoder_t, rent_t>(
          encoder_, key::make_system_key(key::kRentKey))) {
    rent_ = *rent;
  }
  if (!chain_id_.has_value()) {
    spdlog::info("Store is empty; waiting for genesis");
  }
}

}  // namespace crowdfund::execution
