#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <crowdfund/execution/engine.hpp>
#include <crowdfund/rpc/server.hpp>
#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

// "<pubkey-hex>:<lamports>"
std::optional<crowdfund::schema::genesis_account_t> parse_fund(
    const std::string& value) {
  auto separator = value.find(':');
  if (separator == std::string::npos) {
    return std::nullopt;
  }
  auto owner = crowdfund::schema::try_from_hex(
      std::string_view{value}.substr(0, separator));
  if (!owner || owner->size() != std::tuple_size_v<crowdfund::schema::pubkey_t>) {
    return std::nullopt;
  }
  auto amount_text = std::string_view{value}.substr(separator + 1);
  auto lamports = crowdfund::schema::lamports_t{};
  auto [end, error] = std::from_chars(
      amount_text.data(), amount_text.data() + amount_text.size(), lamports);
  if (error != std::errc{} || end != amount_text.data() + amount_text.size()) {
    return std::nullopt;
  }
  auto account = crowdfund::schema::genesis_account_t{};
  std::copy(std::begin(*owner), std::end(*owner), std::begin(account.owner));
  account.lamports = lamports;
  return account;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "crowdfund.log", false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "crowdfund", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto chain_name = std::string{};
  auto funds = std::vector<std::string>{};

  auto vm = boost::program_options::variables_map{};
  auto description =
      boost::program_options::options_description{"Crowdfund ledger"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-address,g",
      boost::program_options::value<std::string>(&grpc_address)
          ->default_value("0.0.0.0:26658"),
      "IP:Port for the ledger gRPC service")(
      "db-path",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "./crowdfund-db"),
      "RocksDB directory")(
      "chain-name",
      boost::program_options::value<std::string>(&chain_name)->default_value(
          "crowdfund-local"),
      "Chain name hashed into the chain id at genesis")(
      "fund",
      boost::program_options::value<std::vector<std::string>>(&funds)
          ->composing(),
      "Genesis wallet as <pubkey-hex>:<lamports>, repeatable")(
      "strict-crypto", "Verify Ed25519 transaction signatures")(
      "verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    spdlog::error("{}", ex.what());
    std::cerr << description << std::endl;
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto genesis = crowdfund::schema::genesis_t{};
  genesis.chain_name = chain_name;
  for (const auto& fund : funds) {
    auto account = parse_fund(fund);
    if (!account) {
      spdlog::error("Invalid --fund value '{}'", fund);
      spdlog::shutdown();
      return 1;
    }
    genesis.accounts.push_back(*account);
  }

  auto encoder = crowdfund::schema::encoding::encoder<
      crowdfund::schema::encoding::scale_encoder_tag>{};
  auto storage = crowdfund::storage::make_storage<
      crowdfund::storage::rocksdb_storage_tag>(db_path);
  auto engine = crowdfund::execution::engine{encoder, storage,
                                             vm.contains("strict-crypto")};

  if (auto error = engine.init_chain(genesis)) {
    if (error->code != static_cast<uint32_t>(
                           crowdfund::schema::transaction_error_code::
                               chain_already_initialized)) {
      spdlog::error("Genesis failed: {}", error->message);
      spdlog::shutdown();
      return 1;
    }
    spdlog::info("Resuming existing chain at height {}",
                 engine.info().last_block_height);
  }

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = crowdfund::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    crowdfund::common::critical("failed to start gRPC server");
  }
  spdlog::info("Ledger gRPC service listening on {}", grpc_address);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::info("Shutting down");
  spdlog::shutdown();
  return 0;
}
