#pragma once

#include <sentinel/execution/signature_verifier.hpp>
#include <sentinel/ledger/multi_vault_ledger.hpp>
#include <sentinel/ledger/single_vault_ledger.hpp>
#include <sentinel/schema/app_info.hpp>
#include <sentinel/schema/block_result.hpp>
#include <sentinel/schema/commit_result.hpp>
#include <sentinel/schema/encoding/encoder.hpp>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/schema/global_config.hpp>
#include <sentinel/schema/history_entry.hpp>
#include <sentinel/schema/ledger_model.hpp>
#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/query_result.hpp>
#include <sentinel/schema/transaction.hpp>
#include <sentinel/schema/transaction_result.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sentinel::execution {

/// Deployment parameters. Only used the first time the engine starts on an
/// empty database; afterwards the persisted configuration wins, except that
/// a different ledger model is a fatal error.
struct engine_options final {
  sentinel::schema::ledger_model_t model{
      sentinel::schema::ledger_model_t::multi_vault};
  sentinel::schema::amount_t fee_amount{sentinel::schema::kDefaultFeeAmount};
  sentinel::schema::address_t fee_recipient{};
  bool require_strict_crypto{true};
};

/// Deterministic vault ledger state machine driven by the host service.
///
/// The engine decodes and validates signed transactions, applies them to
/// the configured ledger model block by block, persists state on commit and
/// answers read queries. Every public call is serialized by one mutex.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends and reload any
  /// committed state. Terminates when the stored ledger model differs from
  /// `options.model`.
  explicit engine(
      sentinel::schema::encoding::encoder<
          sentinel::schema::encoding::scale_encoder_tag>& encoder,
      sentinel::storage::storage<sentinel::storage::rocksdb_storage_tag>&
          storage,
      engine_options options = {});

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Performs decode + envelope validation only; does not mutate state.
  sentinel::schema::transaction_result_t check_transaction(
      const sentinel::schema::bytes_view_t& raw_tx);

  /// Validate a transaction while building or checking a proposal.
  ///
  /// Reuses the CheckTx validation pipeline.
  sentinel::schema::transaction_result_t process_proposal_transaction(
      const sentinel::schema::bytes_view_t& raw_tx);

  /// Execute a block at `height` and compute its resulting state_root.
  ///
  /// Transactions are applied in order with the block height as the ledger
  /// clock; a result is returned for every transaction, including failures.
  sentinel::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<sentinel::schema::bytes_t>& txs);

  /// Persist everything the last finalized block changed in one batch.
  sentinel::schema::commit_result_t commit();

  /// Application metadata (model, latest committed height and state_root).
  sentinel::schema::app_info_t info() const;

  /// Execute a read query by route. `data` is the SCALE encoded route key.
  sentinel::schema::query_result_t query(
      std::string_view path,
      const sentinel::schema::bytes_view_t& data);

  /// Committed history entries in the inclusive height range.
  std::vector<sentinel::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Install a signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  sentinel::schema::ledger_model_t model() const;

 private:
  using ledger_variant_t =
      std::variant<sentinel::ledger::ledger<sentinel::ledger::single_vault_tag>,
                   sentinel::ledger::ledger<sentinel::ledger::multi_vault_tag>>;

  /// Validate envelope version, chain id, payload shape, nonce and
  /// signature.
  sentinel::schema::transaction_result_t validate_transaction(
      const sentinel::schema::transaction_t& tx,
      std::string_view codespace,
      uint64_t expected_nonce);

  /// Apply a validated transaction to the ledger at `height`.
  sentinel::schema::transaction_result_t execute_operation(
      const sentinel::schema::transaction_t& tx,
      uint64_t height);

  sentinel::schema::transaction_result_t check_locked(
      const sentinel::schema::bytes_view_t& raw_tx,
      std::string_view codespace);

  /// Last nonce used by signer, counting uncommitted block-local updates.
  uint64_t last_nonce(const sentinel::schema::bytes_t& nonce_key,
                      bool include_pending) const;

  /// Load config, vaults, nonces and the committed checkpoint at startup.
  void load_persisted_state(const engine_options& options);

  mutable std::mutex mutex_;
  sentinel::schema::encoding::encoder<
      sentinel::schema::encoding::scale_encoder_tag>& encoder_;
  sentinel::storage::storage<sentinel::storage::rocksdb_storage_tag>& storage_;
  sentinel::schema::ledger_model_t model_{
      sentinel::schema::ledger_model_t::multi_vault};
  std::optional<ledger_variant_t> ledger_;
  int64_t last_committed_height_{};
  sentinel::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  sentinel::schema::hash32_t pending_state_root_{};
  sentinel::schema::hash32_t chain_id_{};
  std::map<sentinel::schema::bytes_t, uint64_t> nonces_;
  std::map<sentinel::schema::bytes_t, uint64_t> pending_nonces_;
  std::vector<sentinel::schema::history_entry_t> pending_history_;
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace sentinel::execution
