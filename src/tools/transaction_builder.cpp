#include <boost/program_options.hpp>
#include <crowdfund/address/derive.hpp>
#include <crowdfund/blake3/hash.hpp>
#include <crowdfund/common/critical.hpp>
#include <crowdfund/crypto/verify.hpp>
#include <crowdfund/execution/signing.hpp>
#include <crowdfund/schema/encoding/scale/encoder.hpp>
#include <crowdfund/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace {

using encoder_t = crowdfund::schema::encoding::encoder<
    crowdfund::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

template <typename Array>
Array get_fixed_hex(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    crowdfund::common::critical("missing required --" + name);
  }
  auto bytes = crowdfund::schema::try_from_hex(vm[name].as<std::string>());
  auto out = Array{};
  if (!bytes || bytes->size() != out.size()) {
    crowdfund::common::critical("--" + name + " must be " +
                                std::to_string(out.size()) + " bytes of hex");
  }
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(out));
  return out;
}

crowdfund::schema::hash32_t get_hash32(const po::variables_map& vm,
                                       const std::string& name) {
  return get_fixed_hex<crowdfund::schema::hash32_t>(vm, name);
}

crowdfund::schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (vm.contains("chain-id")) {
    return get_hash32(vm, "chain-id");
  }
  return crowdfund::blake3::hash(
      std::string_view{vm["chain-name"].as<std::string>()});
}

crowdfund::schema::transaction_payload_t build_payload(
    const po::variables_map& vm,
    const crowdfund::schema::pubkey_t& signer) {
  auto payload = vm["payload"].as<std::string>();
  auto amount = vm["amount"].as<uint64_t>();

  if (payload == "create") {
    auto create = crowdfund::schema::create_campaign_t{};
    create.campaign = vm.contains("campaign")
                          ? get_hash32(vm, "campaign")
                          : crowdfund::address::campaign_address(signer);
    create.name = vm["name"].as<std::string>();
    create.description = vm["description"].as<std::string>();
    return create;
  }
  if (payload == "donate") {
    return crowdfund::schema::donate_t{.campaign = get_hash32(vm, "campaign"),
                                       .amount = amount};
  }
  if (payload == "withdraw") {
    return crowdfund::schema::withdraw_t{
        .campaign = get_hash32(vm, "campaign"), .amount = amount};
  }
  if (payload == "transfer") {
    return crowdfund::schema::transfer_t{.to = get_hash32(vm, "to"),
                                         .amount = amount};
  }
  crowdfund::common::critical("payload must be create|donate|withdraw|transfer");
}

crowdfund::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info") {
    return {};
  }
  if (path == "/rent/minimum_balance") {
    return encoder_t{}.encode(vm["size"].as<uint64_t>());
  }
  if (path == "/account" || path == "/campaign" ||
      path == "/campaign/address" || path == "/nonce") {
    auto key = get_hash32(vm, "key");
    return crowdfund::schema::bytes_t{std::begin(key), std::end(key)};
  }
  crowdfund::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  crowdfund_transaction_builder keygen\n"
            << "  crowdfund_transaction_builder transaction [options]\n"
            << "  crowdfund_transaction_builder campaign-address --creator HEX\n"
            << "  crowdfund_transaction_builder query-key [options]\n"
            << "  crowdfund_transaction_builder chain-id [--chain-name NAME]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"crowdfund_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "keygen|transaction|campaign-address|query-key|chain-id")(
      "payload", po::value<std::string>(), "create|donate|withdraw|transfer")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "chain-name", po::value<std::string>()->default_value("crowdfund-local"),
      "chain name hashed into the chain id")(
      "nonce", po::value<uint64_t>()->default_value(0), "transaction nonce")(
      "secret-key", po::value<std::string>(), "Ed25519 secret key hex")(
      "signer", po::value<std::string>(),
      "signer public key hex for an unsigned transaction")(
      "campaign", po::value<std::string>(), "campaign address hex")(
      "name", po::value<std::string>()->default_value(""), "campaign name")(
      "description", po::value<std::string>()->default_value(""),
      "campaign description")(
      "amount", po::value<uint64_t>()->default_value(0), "lamports")(
      "to", po::value<std::string>(), "transfer recipient public key hex")(
      "creator", po::value<std::string>(), "campaign creator public key hex")(
      "path", po::value<std::string>(), "query path")(
      "key", po::value<std::string>(), "32-byte query key hex")(
      "size", po::value<uint64_t>()->default_value(0),
      "account size for /rent/minimum_balance");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "keygen") {
    auto keypair = crowdfund::crypto::generate_ed25519_keypair();
    if (!keypair) {
      crowdfund::common::critical("Ed25519 key generation failed");
    }
    std::cout << "secret-key " << crowdfund::schema::to_hex(keypair->secret_key)
              << '\n'
              << "public-key " << crowdfund::schema::to_hex(keypair->public_key)
              << '\n';
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      crowdfund::common::critical("transaction mode requires --payload");
    }
    auto secret_key =
        vm.contains("secret-key")
            ? std::optional{get_fixed_hex<crowdfund::schema::ed25519_secret_key_t>(
                  vm, "secret-key")}
            : std::nullopt;
    auto signer = crowdfund::schema::pubkey_t{};
    if (secret_key) {
      auto keypair = crowdfund::crypto::ed25519_keypair_from_secret(*secret_key);
      if (!keypair) {
        crowdfund::common::critical("invalid Ed25519 secret key");
      }
      signer = keypair->public_key;
    } else {
      signer = get_hash32(vm, "signer");
    }

    auto transaction = crowdfund::schema::transaction_t{
        .version = 1,
        .chain_id = get_chain_id(vm),
        .nonce = vm["nonce"].as<uint64_t>(),
        .signer = signer,
        .payload = build_payload(vm, signer),
        .signature = {}};
    if (secret_key) {
      auto message = crowdfund::execution::signing_bytes(transaction);
      auto signature = crowdfund::crypto::sign_ed25519(
          crowdfund::schema::bytes_view_t{message.data(), message.size()},
          *secret_key);
      if (!signature) {
        crowdfund::common::critical("Ed25519 signing failed");
      }
      transaction.signature = *signature;
    }
    std::cout << crowdfund::schema::to_hex(encoder_t{}.encode(transaction))
              << '\n';
    return 0;
  }

  if (command == "campaign-address") {
    std::cout << crowdfund::schema::to_hex(crowdfund::address::campaign_address(
                     get_hash32(vm, "creator")))
              << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      crowdfund::common::critical("query-key mode requires --path");
    }
    std::cout << crowdfund::schema::to_hex(build_query_key(vm)) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << crowdfund::schema::to_hex(get_chain_id(vm)) << '\n';
    return 0;
  }

  crowdfund::common::critical(
      "command must be keygen|transaction|campaign-address|query-key|chain-id");
}
