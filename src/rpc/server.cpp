#include <spdlog/spdlog.h>
#include <crowdfund/rpc/server.hpp>
#include <string>
#include <utility>
#include <vector>

using namespace crowdfund::rpc;
using namespace crowdfund::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

void populate_tx_result(const transaction_result_t& source,
                        crowdfund::rpc::v1::TxResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    auto* out_event = destination->add_events();
    out_event->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* out_attribute = out_event->add_attributes();
      out_attribute->set_key(attribute.key);
      out_attribute->set_value(attribute.value);
      out_attribute->set_index(attribute.index);
    }
  }
}

}  // namespace

listener::listener(crowdfund::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const crowdfund::rpc::v1::InfoRequest*,
    crowdfund::rpc::v1::InfoResponse* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_state_root(make_string(
      bytes_view_t{info.last_block_state_root.data(),
                   info.last_block_state_root.size()}));
  response->set_chain_id(
      make_string(bytes_view_t{info.chain_id.data(), info.chain_id.size()}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTransaction(
    grpc::CallbackServerContext* context,
    const crowdfund::rpc::v1::CheckTransactionRequest* request,
    crowdfund::rpc::v1::CheckTransactionResponse* response) {
  auto result = execution_engine_.check_transaction(make_bytes_view(request->tx()));
  populate_tx_result(result, response->mutable_result());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SubmitTransaction(
    grpc::CallbackServerContext* context,
    const crowdfund::rpc::v1::SubmitTransactionRequest* request,
    crowdfund::rpc::v1::SubmitTransactionResponse* response) {
  auto lock = std::scoped_lock{submit_mutex_};
  auto raw_tx = make_bytes(request->tx());
  auto checked = execution_engine_.check_transaction(
      bytes_view_t{raw_tx.data(), raw_tx.size()});
  if (checked.code != 0) {
    // Rejected envelopes never open a block.
    auto info = execution_engine_.info();
    populate_tx_result(checked, response->mutable_result());
    response->set_height(info.last_block_height);
    response->set_state_root(make_string(
        bytes_view_t{info.last_block_state_root.data(),
                     info.last_block_state_root.size()}));
    spdlog::debug("Rejected submitted transaction (code {}): {}", checked.code,
                  checked.log);
    return finish_ok(context);
  }

  auto height =
      static_cast<uint64_t>(execution_engine_.info().last_block_height) + 1;
  auto block = execution_engine_.finalize_block(
      height, std::vector<bytes_t>{std::move(raw_tx)});
  auto committed = execution_engine_.commit();
  if (!block.tx_results.empty()) {
    populate_tx_result(block.tx_results.front(), response->mutable_result());
  }
  response->set_height(committed.committed_height);
  response->set_state_root(make_string(
      bytes_view_t{committed.state_root.data(), committed.state_root.size()}));
  spdlog::debug("Submitted transaction committed at height {} (code {})",
                committed.committed_height, response->result().code());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const crowdfund::rpc::v1::QueryRequest* request,
    crowdfund::rpc::v1::QueryResponse* response) {
  auto result = execution_engine_.query(request->path(),
                                        make_bytes_view(request->data()));
  response->set_code(result.code);
  response->set_log(result.log);
  response->set_info(result.info);
  response->set_key(make_string(result.key));
  response->set_value(make_string(result.value));
  response->set_height(result.height);
  response->set_codespace(result.codespace);
  return finish_ok(context);
}
