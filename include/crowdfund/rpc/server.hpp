#pragma once

#include <crowdfund/rpc/v1/ledger.grpc.pb.h>
#include <crowdfund/execution/engine.hpp>
#include <mutex>

namespace crowdfund::rpc {

/// Callback listener exposing the execution engine over gRPC.
///
/// - Info: committed height, state root and chain id.
/// - CheckTransaction: envelope validation only; no state mutation.
/// - SubmitTransaction: one transaction block at the next height, committed.
/// - Query: read committed state by route.
struct listener final : public crowdfund::rpc::v1::Ledger::CallbackService {
  explicit listener(crowdfund::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const crowdfund::rpc::v1::InfoRequest* request,
      crowdfund::rpc::v1::InfoResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CheckTransaction(
      grpc::CallbackServerContext* context,
      const crowdfund::rpc::v1::CheckTransactionRequest* request,
      crowdfund::rpc::v1::CheckTransactionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* SubmitTransaction(
      grpc::CallbackServerContext* context,
      const crowdfund::rpc::v1::SubmitTransactionRequest* request,
      crowdfund::rpc::v1::SubmitTransactionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const crowdfund::rpc::v1::QueryRequest* request,
      crowdfund::rpc::v1::QueryResponse* response) override final;

  crowdfund::execution::engine& execution_engine_;
  // Serializes read-height, finalize, commit of submitted transactions.
  std::mutex submit_mutex_;
};

}  // namespace crowdfund::rpc
