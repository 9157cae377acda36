#pragma once

#include <sentinel/ledger/call_context.hpp>
#include <sentinel/ledger/ledger.hpp>
#include <sentinel/ledger/ledger_result.hpp>
#include <sentinel/schema/global_config.hpp>
#include <sentinel/schema/vault_state.hpp>
#include <sentinel/schema/vault_status_view.hpp>

#include <map>
#include <set>
#include <vector>

namespace sentinel::ledger {

/// Single-vault model: each owner holds at most one vault, addressed by the
/// owner's address. Records carry vault id 0.
template <>
class ledger<single_vault_tag> final {
 public:
  explicit ledger(sentinel::schema::global_config_t config);

  /// Open the caller's vault. Fails with vault_already_exists when the
  /// caller already owns one, including a finalized one.
  ledger_result_t<bool> create_vault(
      const call_context_t& context,
      const sentinel::schema::address_t& beneficiary);

  ledger_result_t<bool> check_in(const call_context_t& context);

  ledger_result_t<bool> deposit(const call_context_t& context,
                                const sentinel::schema::amount_t& amount);

  ledger_result_t<bool> set_beneficiary(
      const call_context_t& context,
      const sentinel::schema::address_t& beneficiary);

  /// Open to any caller; owner selects the vault.
  ledger_result_t<sentinel::schema::amount_t> trigger_tier1(
      const call_context_t& context,
      const sentinel::schema::address_t& owner);

  ledger_result_t<sentinel::schema::amount_t> trigger_tier2(
      const call_context_t& context,
      const sentinel::schema::address_t& owner);

  /// Status bundle at current_block. A missing vault yields an all-zero
  /// bundle with full countdowns measured from block 0.
  sentinel::schema::vault_status_view_t get_status(
      const sentinel::schema::address_t& owner,
      sentinel::schema::block_height_t current_block) const;

  /// Zero address when the owner has no vault.
  sentinel::schema::address_t get_beneficiary(
      const sentinel::schema::address_t& owner) const;

  bool has_vault(const sentinel::schema::address_t& owner) const;

  sentinel::schema::amount_t get_fee_amount() const;

  const sentinel::schema::global_config_t& config() const;

  /// Vault records changed since the last call, in owner order.
  std::vector<sentinel::schema::vault_state_t> take_touched();

  /// Replace all records with persisted ones. Clears the touched set.
  void restore(std::vector<sentinel::schema::vault_state_t> vaults);

 private:
  sentinel::schema::vault_state_t* find(
      const sentinel::schema::address_t& owner);
  const sentinel::schema::vault_state_t* find(
      const sentinel::schema::address_t& owner) const;

  sentinel::schema::global_config_t config_;
  std::map<sentinel::schema::address_t, sentinel::schema::vault_state_t>
      vaults_;
  std::set<sentinel::schema::address_t> touched_;
};

}  // namespace sentinel::ledger
