#pragma once

#include <sentinel/ledger/call_context.hpp>
#include <sentinel/ledger/ledger.hpp>
#include <sentinel/ledger/ledger_result.hpp>
#include <sentinel/schema/global_config.hpp>
#include <sentinel/schema/vault_state.hpp>
#include <sentinel/schema/vault_status_view.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace sentinel::ledger {

/// Multi-vault model: vaults live in an arena addressed by dense sequential
/// ids starting at 1, with an append-only owner -> ids index kept in
/// creation order.
template <>
class ledger<multi_vault_tag> final {
 public:
  explicit ledger(sentinel::schema::global_config_t config);

  /// Open a new vault for the caller and return its id. Ids are never
  /// reused.
  ledger_result_t<sentinel::schema::vault_id_t> create_vault(
      const call_context_t& context,
      const sentinel::schema::address_t& beneficiary);

  ledger_result_t<bool> check_in(const call_context_t& context,
                                 const sentinel::schema::vault_id_t& vault_id);

  ledger_result_t<bool> deposit(const call_context_t& context,
                                const sentinel::schema::vault_id_t& vault_id,
                                const sentinel::schema::amount_t& amount);

  ledger_result_t<bool> set_beneficiary(
      const call_context_t& context,
      const sentinel::schema::vault_id_t& vault_id,
      const sentinel::schema::address_t& beneficiary);

  ledger_result_t<sentinel::schema::amount_t> trigger_tier1(
      const call_context_t& context,
      const sentinel::schema::vault_id_t& vault_id);

  ledger_result_t<sentinel::schema::amount_t> trigger_tier2(
      const call_context_t& context,
      const sentinel::schema::vault_id_t& vault_id);

  sentinel::schema::vault_status_view_t get_status(
      const sentinel::schema::vault_id_t& vault_id,
      sentinel::schema::block_height_t current_block) const;

  sentinel::schema::address_t get_beneficiary(
      const sentinel::schema::vault_id_t& vault_id) const;

  bool has_vault(const sentinel::schema::vault_id_t& vault_id) const;

  /// Number of vaults the owner has created.
  uint64_t get_vault_count(const sentinel::schema::address_t& owner) const;

  /// index-th vault created by owner; index_out_of_bounds when
  /// index >= get_vault_count(owner).
  ledger_result_t<sentinel::schema::vault_id_t> get_vault_id_by_index(
      const sentinel::schema::address_t& owner,
      uint64_t index) const;

  sentinel::schema::amount_t get_fee_amount() const;

  const sentinel::schema::global_config_t& config() const;

  /// Vault records changed since the last call, in id order.
  std::vector<sentinel::schema::vault_state_t> take_touched();

  /// Replace all records with persisted ones and rebuild the owner index
  /// from them. Clears the touched set.
  void restore(std::vector<sentinel::schema::vault_state_t> vaults);

 private:
  std::optional<std::size_t> slot_of(
      const sentinel::schema::vault_id_t& vault_id) const;

  sentinel::schema::global_config_t config_;
  std::vector<sentinel::schema::vault_state_t> arena_;
  std::map<sentinel::schema::address_t,
           std::vector<sentinel::schema::vault_id_t>>
      owner_index_;
  std::set<std::size_t> touched_;
};

}  // namespace sentinel::ledger
