#pragma once

#include <sentinel/host/v1/host.grpc.pb.h>
#include <sentinel/execution/engine.hpp>

namespace sentinel::host {

/// Host callback listener used by the block producer to drive the ledger.
///
/// Quick reference:
/// - Echo: liveness.
/// - Info: handshake; ledger model and last committed state_root.
/// - CheckTx: mempool admission checks; no state mutation.
/// - PrepareProposal: proposer-side tx selection under max_tx_bytes.
/// - ProcessProposal: validator-side proposal accept/reject decision.
/// - FinalizeBlock: execute block and return tx results + state_root.
/// - Commit: persist finalized state.
/// - Query: read-only routes against the last finalized state.
struct listener final : public sentinel::host::v1::Host::CallbackService {
  /// Bind listener to execution engine instance.
  explicit listener(sentinel::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Echo(
      grpc::CallbackServerContext* context,
      const sentinel::host::v1::RequestEcho* request,
      sentinel::host::v1::ResponseEcho* response) override final;

  /// Return app metadata used during node/app handshake.
  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const sentinel::host::v1::RequestInfo* request,
      sentinel::host::v1::ResponseInfo* response) override final;

  /// Mempool admission check for a single tx (decode/validate only).
  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const sentinel::host::v1::RequestCheckTx* request,
      sentinel::host::v1::ResponseCheckTx* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const sentinel::host::v1::RequestQuery* request,
      sentinel::host::v1::ResponseQuery* response) override final;

  /// Keeps admissible txs in order until max_tx_bytes would be exceeded.
  virtual grpc::ServerUnaryReactor* PrepareProposal(
      grpc::CallbackServerContext* context,
      const sentinel::host::v1::RequestPrepareProposal* request,
      sentinel::host::v1::ResponsePrepareProposal* response) override final;

  /// REJECT as soon as one tx fails admission, ACCEPT otherwise.
  virtual grpc::ServerUnaryReactor* ProcessProposal(
      grpc::CallbackServerContext* context,
      const sentinel::host::v1::RequestProcessProposal* request,
      sentinel::host::v1::ResponseProcessProposal* response) override final;

  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const sentinel::host::v1::RequestFinalizeBlock* request,
      sentinel::host::v1::ResponseFinalizeBlock* response) override final;

  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const sentinel::host::v1::RequestCommit* request,
      sentinel::host::v1::ResponseCommit* response) override final;

  sentinel::execution::engine& execution_engine_;
};

}  // namespace sentinel::host
