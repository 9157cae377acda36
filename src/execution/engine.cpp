#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <sentinel/blake3/hash.hpp>
#include <sentinel/common/critical.hpp>
#include <sentinel/crypto/verify.hpp>
#include <sentinel/execution/engine.hpp>
#include <sentinel/schema/key/engine_keys.hpp>
#include <sentinel/schema/query_error_code.hpp>
#include <sentinel/schema/transaction_error_code.hpp>
#include <sentinel/schema/vault_error_code.hpp>
#include <iterator>
#include <tuple>
#include <type_traits>
#include <utility>

using namespace sentinel::schema;

namespace {

using encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;
using sentinel::ledger::call_context_t;
using sentinel::ledger::ledger;
using sentinel::ledger::ledger_result_t;
using sentinel::ledger::multi_vault_tag;
using sentinel::ledger::single_vault_tag;

inline constexpr auto kCheckTxCodespace = std::string_view{"sentinel.checktx"};
inline constexpr auto kFinalizeCodespace =
    std::string_view{"sentinel.finalize"};
inline constexpr auto kQueryCodespace = std::string_view{"sentinel.query"};
inline constexpr auto kChainIdSeed = std::string_view{"sentinel-chain"};

// Vault addressing per ledger model. Single-vault ledgers are keyed by owner
// address, multi-vault ledgers by allocated id.
template <typename Model>
struct model_traits;

template <>
struct model_traits<single_vault_tag> final {
  using key_t = address_t;

  static key_t own_key(const call_context_t& context,
                       const std::optional<vault_id_t>&) {
    return context.caller;
  }

  static const key_t* target_key(const vault_ref_t& target) {
    return std::get_if<address_t>(&target);
  }
};

template <>
struct model_traits<multi_vault_tag> final {
  using key_t = vault_id_t;

  static key_t own_key(const call_context_t&,
                       const std::optional<vault_id_t>& vault_id) {
    return *vault_id;
  }

  static const key_t* target_key(const vault_ref_t& target) {
    return std::get_if<vault_id_t>(&target);
  }
};

template <typename Model>
inline constexpr bool is_single_v = std::is_same_v<Model, single_vault_tag>;

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint64_t index) {
  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  return sentinel::blake3::hash({bytes_view_t{seed}, bytes_view_t{tx},
                                 bytes_view_t{encoded_suffix}});
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed transaction bytes";
  }
  return tx;
}

bool payload_matches_model(const transaction_payload_t& payload,
                           const ledger_model_t model) {
  auto wants_id = model == ledger_model_t::multi_vault;
  auto id_shape = [&](const std::optional<vault_id_t>& vault_id) {
    return vault_id.has_value() == wants_id;
  };
  auto ref_shape = [&](const vault_ref_t& target) {
    return std::holds_alternative<vault_id_t>(target) == wants_id;
  };
  return std::visit(
      overloaded{[](const create_vault_t&) { return true; },
                 [&](const check_in_t& value) { return id_shape(value.vault_id); },
                 [&](const deposit_t& value) { return id_shape(value.vault_id); },
                 [&](const set_beneficiary_t& value) {
                   return id_shape(value.vault_id);
                 },
                 [&](const trigger_tier1_t& value) {
                   return ref_shape(value.target);
                 },
                 [&](const trigger_tier2_t& value) {
                   return ref_shape(value.target);
                 }},
      payload);
}

transaction_result_t make_error_result(const uint32_t code,
                                       std::string log,
                                       std::string info,
                                       const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = code;
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       std::string log,
                                       std::string info,
                                       const std::string_view codespace) {
  return make_error_result(static_cast<uint32_t>(code), std::move(log),
                           std::move(info), codespace);
}

query_result_t make_query_error(const uint32_t code,
                                std::string log,
                                const bytes_view_t& key,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = code;
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                const int64_t height) {
  return make_query_error(static_cast<uint32_t>(code), std::move(log), key,
                          height);
}

std::string hex(const address_t& address) {
  return to_hex(bytes_view_t{address});
}

transaction_event_attribute_t attribute(std::string key,
                                        std::string value,
                                        const bool index = true) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

template <typename T>
transaction_result_t make_ledger_rejection(const ledger_result_t<T>& result,
                                           const operation_type_t operation) {
  auto code = sentinel::ledger::error_of(result);
  return make_error_result(static_cast<uint32_t>(code),
                           std::string{to_string(code)},
                           std::string{to_string(operation)} + " rejected",
                           kFinalizeCodespace);
}

// Events name a vault by id in the multi model and by owner in the single
// model.
std::string vault_label(const vault_id_t& vault_id) {
  return to_decimal(vault_id);
}

std::string vault_label(const address_t& owner) { return hex(owner); }

template <typename Model>
transaction_result_t apply_payload(ledger<Model>& vaults,
                                   const transaction_payload_t& payload,
                                   const call_context_t& context) {
  using traits = model_traits<Model>;
  auto encoder = encoder_t{};
  auto result = transaction_result_t{};
  auto owner_hex = hex(context.caller);

  std::visit(
      overloaded{
          [&](const create_vault_t& value) {
            auto created = vaults.create_vault(context, value.beneficiary);
            if (!sentinel::ledger::succeeded(created)) {
              result = make_ledger_rejection(created,
                                             operation_type_t::create_vault);
              return;
            }
            auto output = std::get<0>(created);
            result.data = encoder.encode(output);
            auto label = [&] {
              if constexpr (is_single_v<Model>) {
                return vault_label(context.caller);
              } else {
                return vault_label(output);
              }
            }();
            result.events.push_back(transaction_event_t{
                .type = "sentinel.vault_created",
                .attributes = {attribute("vault_id", label),
                               attribute("owner", owner_hex),
                               attribute("beneficiary",
                                         hex(value.beneficiary))}});
          },
          [&](const check_in_t& value) {
            auto key = traits::own_key(context, value.vault_id);
            auto checked = [&] {
              if constexpr (is_single_v<Model>) {
                return vaults.check_in(context);
              } else {
                return vaults.check_in(context, key);
              }
            }();
            if (!sentinel::ledger::succeeded(checked)) {
              result = make_ledger_rejection(checked,
                                             operation_type_t::check_in);
              return;
            }
            result.data = encoder.encode(std::get<bool>(checked));
            result.events.push_back(transaction_event_t{
                .type = "sentinel.checked_in",
                .attributes = {
                    attribute("vault_id", vault_label(key)),
                    attribute("owner", owner_hex),
                    attribute("heartbeat",
                              std::to_string(context.block_height), false)}});
          },
          [&](const deposit_t& value) {
            auto key = traits::own_key(context, value.vault_id);
            auto deposited = [&] {
              if constexpr (is_single_v<Model>) {
                return vaults.deposit(context, value.amount);
              } else {
                return vaults.deposit(context, key, value.amount);
              }
            }();
            if (!sentinel::ledger::succeeded(deposited)) {
              result = make_ledger_rejection(deposited,
                                             operation_type_t::deposit);
              return;
            }
            auto view = vaults.get_status(key, context.block_height);
            result.data = encoder.encode(std::get<bool>(deposited));
            result.events.push_back(transaction_event_t{
                .type = "sentinel.deposited",
                .attributes = {
                    attribute("vault_id", vault_label(key)),
                    attribute("owner", owner_hex),
                    attribute("amount", to_decimal(value.amount), false),
                    attribute("total_deposited",
                              to_decimal(view.total_deposited), false),
                    attribute("tier1_amount", to_decimal(view.tier1_amount),
                              false),
                    attribute("tier2_amount", to_decimal(view.tier2_amount),
                              false)}});
          },
          [&](const set_beneficiary_t& value) {
            auto key = traits::own_key(context, value.vault_id);
            auto changed = [&] {
              if constexpr (is_single_v<Model>) {
                return vaults.set_beneficiary(context, value.beneficiary);
              } else {
                return vaults.set_beneficiary(context, key, value.beneficiary);
              }
            }();
            if (!sentinel::ledger::succeeded(changed)) {
              result = make_ledger_rejection(
                  changed, operation_type_t::set_beneficiary);
              return;
            }
            result.data = encoder.encode(std::get<bool>(changed));
            result.events.push_back(transaction_event_t{
                .type = "sentinel.beneficiary_changed",
                .attributes = {
                    attribute("vault_id", vault_label(key)),
                    attribute("owner", owner_hex),
                    attribute("beneficiary", hex(value.beneficiary))}});
          },
          [&](const trigger_tier1_t& value) {
            const auto& key = *traits::target_key(value.target);
            auto released = vaults.trigger_tier1(context, key);
            if (!sentinel::ledger::succeeded(released)) {
              result = make_ledger_rejection(released,
                                             operation_type_t::trigger_tier1);
              return;
            }
            auto amount = std::get<amount_t>(released);
            result.data = encoder.encode(amount);
            result.events.push_back(transaction_event_t{
                .type = "sentinel.tier1_released",
                .attributes = {
                    attribute("vault_id", vault_label(key)),
                    attribute("owner",
                              hex(vaults.get_status(key, context.block_height)
                                      .owner)),
                    attribute("beneficiary", hex(vaults.get_beneficiary(key))),
                    attribute("amount", to_decimal(amount), false),
                    attribute("triggered_by", owner_hex)}});
          },
          [&](const trigger_tier2_t& value) {
            const auto& key = *traits::target_key(value.target);
            auto released = vaults.trigger_tier2(context, key);
            if (!sentinel::ledger::succeeded(released)) {
              result = make_ledger_rejection(released,
                                             operation_type_t::trigger_tier2);
              return;
            }
            auto amount = std::get<amount_t>(released);
            result.data = encoder.encode(amount);
            result.events.push_back(transaction_event_t{
                .type = "sentinel.tier2_released",
                .attributes = {
                    attribute("vault_id", vault_label(key)),
                    attribute("owner",
                              hex(vaults.get_status(key, context.block_height)
                                      .owner)),
                    attribute("beneficiary", hex(vaults.get_beneficiary(key))),
                    attribute("amount", to_decimal(amount), false),
                    attribute("triggered_by", owner_hex)}});
          }},
      payload);
  return result;
}

}  // namespace

namespace sentinel::execution {

engine::engine(encoder_t& encoder,
               sentinel::storage::storage<sentinel::storage::rocksdb_storage_tag>&
                   storage,
               engine_options options)
    : encoder_{encoder},
      storage_{storage},
      model_{options.model},
      chain_id_{sentinel::blake3::hash(kChainIdSeed)},
      require_strict_crypto_{options.require_strict_crypto},
      signature_verifier_{sentinel::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing execution engine ({} ledger)",
               to_string(options.model));
  load_persisted_state(options);
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; signatures are not verified");
  }
  spdlog::info("Execution engine ready at height {}", last_committed_height_);
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  return check_locked(raw_tx, kCheckTxCodespace);
}

transaction_result_t engine::process_proposal_transaction(
    const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  return check_locked(raw_tx, kCheckTxCodespace);
}

transaction_result_t engine::check_locked(const bytes_view_t& raw_tx,
                                          const std::string_view codespace) {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", decode_error, codespace);
  }
  auto nonce_key = sentinel::schema::key::make_nonce_key(encoder_,
                                                         maybe_tx->signer);
  return validate_transaction(*maybe_tx, codespace,
                              last_nonce(nonce_key, false) + 1);
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto tx_result = transaction_result_t{};
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(bytes_view_t{txs[i]}, decode_error);
    if (!maybe_tx) {
      tx_result = make_error_result(transaction_error_code::invalid_transaction,
                                    "invalid transaction", decode_error,
                                    kFinalizeCodespace);
    } else {
      auto nonce_key =
          sentinel::schema::key::make_nonce_key(encoder_, maybe_tx->signer);
      tx_result = validate_transaction(*maybe_tx, kFinalizeCodespace,
                                       last_nonce(nonce_key, true) + 1);
      if (tx_result.code == 0) {
        tx_result = execute_operation(*maybe_tx, height);
      }
      if (tx_result.code == 0) {
        pending_nonces_[nonce_key] = maybe_tx->nonce;
      }
    }

    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    } else {
      spdlog::debug("Transaction {} at height {} rejected: code={} {}", i,
                    height, tx_result.code, tx_result.log);
    }
    pending_history_.push_back(
        history_entry_t{.height = height,
                        .index = static_cast<uint32_t>(i),
                        .code = tx_result.code,
                        .tx = txs[i]});
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    if (pending_height_ < last_committed_height_) {
      spdlog::warn("Commit of height {} below committed height {}; keeping {}",
                   pending_height_, last_committed_height_,
                   last_committed_height_);
    }
    last_committed_height_ = std::max(last_committed_height_, pending_height_);
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }

  auto entries = std::vector<sentinel::storage::key_value_entry_t>{};
  std::visit(
      [&](auto& vaults) {
        for (const auto& vault : vaults.take_touched()) {
          auto key = model_ == ledger_model_t::single_vault
                         ? sentinel::schema::key::make_vault_key(encoder_,
                                                                 vault.owner)
                         : sentinel::schema::key::make_vault_key(
                               encoder_, vault.vault_id);
          entries.emplace_back(std::move(key), encoder_.encode(vault));
        }
        entries.emplace_back(sentinel::schema::key::make_config_key(encoder_),
                             encoder_.encode(vaults.config()));
      },
      *ledger_);
  for (const auto& [nonce_key, nonce] : pending_nonces_) {
    entries.emplace_back(nonce_key, encoder_.encode(nonce));
    nonces_[nonce_key] = nonce;
  }
  for (const auto& entry : pending_history_) {
    entries.emplace_back(sentinel::schema::key::make_history_key(
                             encoder_, entry.height, entry.index),
                         encoder_.encode(entry));
  }

  storage_.commit(entries,
                  sentinel::storage::committed_state{
                      .height = last_committed_height_,
                      .state_root = last_committed_state_root_});
  pending_nonces_.clear();
  pending_history_.clear();
  spdlog::debug("Committed height {} ({} entries)", last_committed_height_,
                entries.size());

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.model = model_;
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  // Reads see the last finalized block, which is also the ledger clock.
  auto height = std::max(last_committed_height_, pending_height_);
  auto current_block = static_cast<block_height_t>(height);

  auto ok = [&](bytes_t value) {
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.value = std::move(value);
    result.height = height;
    result.codespace = std::string{kQueryCodespace};
    return result;
  };
  auto invalid_key = [&](std::string log) {
    return make_query_error(query_error_code::invalid_key, std::move(log),
                            data, height);
  };

  if (path == "/engine/info") {
    return ok(encoder_.encode(std::tuple{last_committed_height_,
                                         last_committed_state_root_,
                                         chain_id_}));
  }
  if (path == "/engine/keyspaces") {
    auto keyspaces = std::vector<std::string>{};
    for (const auto& keyspace : sentinel::schema::key::kEngineKeyspaces) {
      keyspaces.emplace_back(keyspace);
    }
    return ok(encoder_.encode(keyspaces));
  }
  if (path == "/config/fee") {
    return std::visit(
        [&](const auto& vaults) { return ok(encoder_.encode(vaults.get_fee_amount())); },
        *ledger_);
  }
  if (path == "/config/global") {
    return std::visit(
        [&](const auto& vaults) { return ok(encoder_.encode(vaults.config())); },
        *ledger_);
  }
  if (path == "/vault/status" || path == "/vault/beneficiary" ||
      path == "/vault/exists") {
    auto target = encoder_.try_decode<vault_ref_t>(data);
    if (!target) {
      return invalid_key("expected SCALE vault reference");
    }
    return std::visit(
        [&](const auto& vaults) -> query_result_t {
          using model_t = std::conditional_t<
              std::is_same_v<std::decay_t<decltype(vaults)>,
                             ledger<single_vault_tag>>,
              single_vault_tag, multi_vault_tag>;
          const auto* key = model_traits<model_t>::target_key(*target);
          if (key == nullptr) {
            return invalid_key("vault reference does not match ledger model");
          }
          if (path == "/vault/status") {
            return ok(encoder_.encode(vaults.get_status(*key, current_block)));
          }
          if (path == "/vault/beneficiary") {
            return ok(encoder_.encode(vaults.get_beneficiary(*key)));
          }
          return ok(encoder_.encode(vaults.has_vault(*key)));
        },
        *ledger_);
  }
  if (path == "/vault/count" || path == "/vault/id_by_index") {
    auto* vaults = std::get_if<ledger<multi_vault_tag>>(&*ledger_);
    if (vaults == nullptr) {
      return make_query_error(query_error_code::unsupported_path,
                              "route requires the multi-vault ledger", data,
                              height);
    }
    if (path == "/vault/count") {
      auto owner = encoder_.try_decode<address_t>(data);
      if (!owner) {
        return invalid_key("expected SCALE owner address");
      }
      return ok(encoder_.encode(vaults->get_vault_count(*owner)));
    }
    auto key = encoder_.try_decode<std::tuple<address_t, uint64_t>>(data);
    if (!key) {
      return invalid_key("expected SCALE (owner, index) tuple");
    }
    auto vault_id =
        vaults->get_vault_id_by_index(std::get<0>(*key), std::get<1>(*key));
    if (!sentinel::ledger::succeeded(vault_id)) {
      auto code = sentinel::ledger::error_of(vault_id);
      return make_query_error(static_cast<uint32_t>(code),
                              std::string{to_string(code)}, data, height);
    }
    return ok(encoder_.encode(std::get<vault_id_t>(vault_id)));
  }
  if (path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range || std::get<0>(*range) > std::get<1>(*range)) {
      return invalid_key("expected SCALE (from, to) height range");
    }
    auto rows = std::vector<history_entry_t>{};
    auto prefix = sentinel::schema::key::make_prefix_key(
        encoder_, sentinel::schema::key::kHistoryPrefix);
    for (const auto& [row_key, row_value] :
         storage_.list_by_prefix(bytes_view_t{prefix})) {
      auto entry = encoder_.decode<history_entry_t>(bytes_view_t{row_value});
      if (entry.height >= std::get<0>(*range) &&
          entry.height <= std::get<1>(*range)) {
        rows.push_back(std::move(entry));
      }
    }
    return ok(encoder_.encode(rows));
  }

  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", data, height);
}

std::vector<history_entry_t> engine::history(const uint64_t from_height,
                                             const uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  auto rows = std::vector<history_entry_t>{};
  auto prefix = sentinel::schema::key::make_prefix_key(
      encoder_, sentinel::schema::key::kHistoryPrefix);
  for (const auto& [row_key, row_value] :
       storage_.list_by_prefix(bytes_view_t{prefix})) {
    auto entry = encoder_.decode<history_entry_t>(bytes_view_t{row_value});
    if (entry.height >= from_height && entry.height <= to_height) {
      rows.push_back(std::move(entry));
    }
  }
  return rows;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

ledger_model_t engine::model() const {
  auto lock = std::scoped_lock{mutex_};
  return model_;
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace,
    const uint64_t expected_nonce) {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             "invalid chain id", "chain id mismatch",
                             codespace);
  }
  if (!payload_matches_model(tx.payload, model_)) {
    return make_error_result(
        transaction_error_code::ledger_model_mismatch,
        "ledger model mismatch",
        std::string{"vault reference shape is not valid for the "} +
            std::string{to_string(model_)} + " ledger",
        codespace);
  }
  if (tx.nonce != expected_nonce) {
    return make_error_result(transaction_error_code::invalid_nonce,
                             "invalid nonce",
                             "expected nonce " + std::to_string(expected_nonce),
                             codespace);
  }
  if (require_strict_crypto_) {
    auto signature_kind_matches = std::visit(
        overloaded{[&](const ed25519_signer_id&) {
                     return std::holds_alternative<ed25519_signature_t>(
                         tx.signature);
                   },
                   [&](const secp256k1_signer_id&) {
                     return std::holds_alternative<secp256k1_signature_t>(
                         tx.signature);
                   },
                   [](const named_signer_t&) { return true; }},
        tx.signer);
    if (!signature_kind_matches) {
      return make_error_result(transaction_error_code::invalid_signature_type,
                               "invalid signature type",
                               "signature does not match signer key type",
                               codespace);
    }
    auto message = signing_bytes(encoder_, tx);
    if (!signature_verifier_ ||
        !signature_verifier_(bytes_view_t{message}, tx.signer, tx.signature)) {
      return make_error_result(
          transaction_error_code::signature_verification_failed,
          "signature verification failed", "", codespace);
    }
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(const transaction_t& tx,
                                               const uint64_t height) {
  auto context =
      call_context_t{.caller = sentinel::crypto::derive_address(tx.signer),
                     .block_height = height};
  auto result = std::visit(
      [&](auto& vaults) { return apply_payload(vaults, tx.payload, context); },
      *ledger_);
  if (result.code == 0) {
    result.info = std::string{to_string(operation_of(tx.payload))};
  }
  return result;
}

uint64_t engine::last_nonce(const bytes_t& nonce_key,
                            const bool include_pending) const {
  if (include_pending) {
    if (auto it = pending_nonces_.find(nonce_key);
        it != std::end(pending_nonces_)) {
      return it->second;
    }
  }
  auto it = nonces_.find(nonce_key);
  return it == std::end(nonces_) ? 0 : it->second;
}

void engine::load_persisted_state(const engine_options& options) {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  }

  auto config_key = sentinel::schema::key::make_config_key(encoder_);
  auto config = storage_.get<global_config_t>(encoder_, bytes_view_t{config_key});
  if (!config) {
    config = global_config_t{.model = options.model,
                             .fee_amount = options.fee_amount,
                             .fee_recipient = options.fee_recipient};
    storage_.put(encoder_, bytes_view_t{config_key}, *config);
    spdlog::info("Deployed {} ledger with fee {} to {}",
                 to_string(config->model), to_decimal(config->fee_amount),
                 hex(config->fee_recipient));
    if (is_zero_address(config->fee_recipient)) {
      spdlog::warn("Deployed without a fee recipient; pass --fee-recipient "
                   "on first start to set one");
    }
  } else if (config->model != options.model) {
    spdlog::critical("Database holds a {} ledger but {} was requested",
                     to_string(config->model), to_string(options.model));
    sentinel::common::critical("ledger model mismatch");
  } else if (config->fee_amount != options.fee_amount ||
             config->fee_recipient != options.fee_recipient) {
    spdlog::warn("Ignoring fee options; deployed configuration is kept");
  }
  model_ = config->model;

  auto vaults = std::vector<vault_state_t>{};
  auto vault_prefix = sentinel::schema::key::make_prefix_key(
      encoder_, sentinel::schema::key::kVaultKeyPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(bytes_view_t{vault_prefix})) {
    vaults.push_back(encoder_.decode<vault_state_t>(bytes_view_t{value}));
  }
  spdlog::info("Loaded {} vault record(s)", vaults.size());

  if (model_ == ledger_model_t::single_vault) {
    ledger_.emplace(std::in_place_type<ledger<single_vault_tag>>, *config);
  } else {
    ledger_.emplace(std::in_place_type<ledger<multi_vault_tag>>, *config);
  }
  std::visit([&](auto& ledger_model) { ledger_model.restore(std::move(vaults)); },
             *ledger_);

  nonces_.clear();
  auto nonce_prefix = sentinel::schema::key::make_prefix_key(
      encoder_, sentinel::schema::key::kNonceKeyPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(bytes_view_t{nonce_prefix})) {
    nonces_[key] = encoder_.decode<uint64_t>(bytes_view_t{value});
  }
}

}  // namespace sentinel::execution
