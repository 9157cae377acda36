#include <spdlog/spdlog.h>
#include <sentinel/host/server.hpp>
#include <string>
#include <vector>

using namespace sentinel::host;
using namespace sentinel::schema;

namespace {

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  return finish(context, grpc::Status::OK);
}

void populate_exec_tx_result(const transaction_result_t& source,
                             sentinel::host::v1::ExecTxResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_gas_wanted(source.gas_wanted);
  destination->set_gas_used(source.gas_used);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    auto* out = destination->add_events();
    out->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* out_attribute = out->add_attributes();
      out_attribute->set_key(attribute.key);
      out_attribute->set_value(attribute.value);
      out_attribute->set_index(attribute.index);
    }
  }
}

}  // namespace

listener::listener(sentinel::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Echo(
    grpc::CallbackServerContext* context,
    const sentinel::host::v1::RequestEcho* request,
    sentinel::host::v1::ResponseEcho* response) {
  response->set_message(request->message());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const sentinel::host::v1::RequestInfo* /*request*/,
    sentinel::host::v1::ResponseInfo* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_ledger_model(std::string{to_string(info.model)});
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_state_root(make_string(info.last_block_state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const sentinel::host::v1::RequestCheckTx* request,
    sentinel::host::v1::ResponseCheckTx* response) {
  auto tx = make_bytes(request->tx());
  auto check = execution_engine_.check_transaction(bytes_view_t{tx});
  response->set_code(check.code);
  response->set_data(make_string(check.data));
  response->set_log(check.log);
  response->set_info(check.info);
  response->set_gas_wanted(check.gas_wanted);
  response->set_gas_used(check.gas_used);
  response->set_codespace(check.codespace);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const sentinel::host::v1::RequestQuery* request,
    sentinel::host::v1::ResponseQuery* response) {
  auto data = make_bytes(request->data());
  auto query = execution_engine_.query(request->path(), bytes_view_t{data});
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::PrepareProposal(
    grpc::CallbackServerContext* context,
    const sentinel::host::v1::RequestPrepareProposal* request,
    sentinel::host::v1::ResponsePrepareProposal* response) {
  auto total_size = int64_t{};
  auto max_bytes = request->max_tx_bytes();
  for (const auto& tx : request->txs()) {
    auto tx_bytes = make_bytes(tx);
    auto check = execution_engine_.check_transaction(bytes_view_t{tx_bytes});
    if (check.code != 0) {
      spdlog::debug("Dropping tx from proposal: {}", check.log);
      continue;
    }
    auto next_size = total_size + static_cast<int64_t>(tx.size());
    if (max_bytes > 0 && next_size > max_bytes) {
      break;
    }
    total_size = next_size;
    *response->add_txs() = tx;
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ProcessProposal(
    grpc::CallbackServerContext* context,
    const sentinel::host::v1::RequestProcessProposal* request,
    sentinel::host::v1::ResponseProcessProposal* response) {
  for (const auto& tx : request->txs()) {
    auto tx_bytes = make_bytes(tx);
    auto tx_result =
        execution_engine_.process_proposal_transaction(bytes_view_t{tx_bytes});
    if (tx_result.code != 0) {
      response->set_status(
          sentinel::host::v1::ResponseProcessProposal_ProposalStatus_REJECT);
      return finish_ok(context);
    }
  }
  response->set_status(
      sentinel::host::v1::ResponseProcessProposal_ProposalStatus_ACCEPT);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::FinalizeBlock(
    grpc::CallbackServerContext* context,
    const sentinel::host::v1::RequestFinalizeBlock* request,
    sentinel::host::v1::ResponseFinalizeBlock* response) {
  if (request->height() <= 0) {
    spdlog::warn("FinalizeBlock rejected: height {}", request->height());
    return finish(context,
                  grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                               "block height must be positive"});
  }
  auto txs = std::vector<bytes_t>{};
  txs.reserve(request->txs_size());
  for (const auto& tx : request->txs()) {
    txs.push_back(make_bytes(tx));
  }

  auto execution = execution_engine_.finalize_block(
      static_cast<uint64_t>(request->height()), txs);
  for (const auto& tx_result : execution.tx_results) {
    populate_exec_tx_result(tx_result, response->add_tx_results());
  }
  response->set_state_root(make_string(execution.state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Commit(
    grpc::CallbackServerContext* context,
    const sentinel::host::v1::RequestCommit* /*request*/,
    sentinel::host::v1::ResponseCommit* response) {
  auto commit = execution_engine_.commit();
  response->set_retain_height(commit.retain_height);
  response->set_committed_height(commit.committed_height);
  response->set_state_root(make_string(commit.state_root));
  return finish_ok(context);
}
