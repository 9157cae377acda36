#pragma once

#include <sentinel/ledger/call_context.hpp>
#include <sentinel/ledger/ledger_result.hpp>
#include <sentinel/schema/operation_type.hpp>
#include <sentinel/schema/vault_error_code.hpp>
#include <sentinel/schema/vault_state.hpp>
#include <sentinel/schema/vault_status_view.hpp>

#include <optional>

// Per-vault transition rules shared by both ledger models.
//
// Every apply_* function evaluates all guards before touching the record, in
// this order: status, ownership (owner-gated operations only), arguments,
// elapsed time. A rejected call leaves the record unchanged.
namespace sentinel::ledger {

/// Status the target vault must be in for the operation to proceed.
constexpr sentinel::schema::vault_status_t required_status(
    const sentinel::schema::operation_type_t operation) {
  switch (operation) {
    case sentinel::schema::operation_type_t::create_vault:
      return sentinel::schema::vault_status_t::uninitialized;
    case sentinel::schema::operation_type_t::trigger_tier2:
      return sentinel::schema::vault_status_t::tier1_released;
    case sentinel::schema::operation_type_t::check_in:
    case sentinel::schema::operation_type_t::deposit:
    case sentinel::schema::operation_type_t::set_beneficiary:
    case sentinel::schema::operation_type_t::trigger_tier1:
      return sentinel::schema::vault_status_t::active;
  }
  return sentinel::schema::vault_status_t::active;
}

/// Status and ownership guards. A vault that does not exist is passed in as
/// a default record, which is uninitialized and fails with invalid_state.
std::optional<sentinel::schema::vault_error_code> check_preconditions(
    const sentinel::schema::vault_state_t& vault,
    sentinel::schema::operation_type_t operation,
    const call_context_t& context);

/// Beneficiary must be non-zero and differ from the owner.
std::optional<sentinel::schema::vault_error_code> validate_beneficiary(
    const sentinel::schema::address_t& owner,
    const sentinel::schema::address_t& beneficiary);

/// Fresh active record owned by the caller with its heartbeat at the
/// current block. The beneficiary must already be validated.
sentinel::schema::vault_state_t open_vault(
    const sentinel::schema::vault_id_t& vault_id,
    const call_context_t& context,
    const sentinel::schema::address_t& beneficiary);

ledger_result_t<bool> apply_check_in(sentinel::schema::vault_state_t& vault,
                                     const call_context_t& context);

ledger_result_t<bool> apply_deposit(sentinel::schema::vault_state_t& vault,
                                    const call_context_t& context,
                                    const sentinel::schema::amount_t& amount);

ledger_result_t<bool> apply_set_beneficiary(
    sentinel::schema::vault_state_t& vault,
    const call_context_t& context,
    const sentinel::schema::address_t& beneficiary);

/// Releases the first tranche; returns tier1_amount.
ledger_result_t<sentinel::schema::amount_t> apply_trigger_tier1(
    sentinel::schema::vault_state_t& vault,
    const call_context_t& context);

/// Releases the second tranche and finalizes the vault; returns
/// tier2_amount.
ledger_result_t<sentinel::schema::amount_t> apply_trigger_tier2(
    sentinel::schema::vault_state_t& vault,
    const call_context_t& context);

sentinel::schema::vault_status_view_t make_status_view(
    const sentinel::schema::vault_state_t& vault,
    sentinel::schema::block_height_t current_block);

}  // namespace sentinel::ledger
