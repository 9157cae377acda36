#include <sentinel/ledger/countdown.hpp>
#include <sentinel/ledger/tier_split.hpp>
#include <sentinel/ledger/vault_machine.hpp>

using namespace sentinel::schema;

namespace sentinel::ledger {

std::optional<vault_error_code> check_preconditions(
    const vault_state_t& vault,
    const operation_type_t operation,
    const call_context_t& context) {
  if (vault.status != required_status(operation)) {
    return vault_error_code::invalid_state;
  }
  if (requires_owner(operation) && vault.owner != context.caller) {
    return vault_error_code::not_owner;
  }
  return std::nullopt;
}

std::optional<vault_error_code> validate_beneficiary(
    const address_t& owner,
    const address_t& beneficiary) {
  if (is_zero_address(beneficiary) || beneficiary == owner) {
    return vault_error_code::invalid_beneficiary;
  }
  return std::nullopt;
}

vault_state_t open_vault(const vault_id_t& vault_id,
                         const call_context_t& context,
                         const address_t& beneficiary) {
  return vault_state_t{.vault_id = vault_id,
                       .owner = context.caller,
                       .beneficiary = beneficiary,
                       .status = vault_status_t::active,
                       .last_heartbeat = context.block_height,
                       .total_deposited = 0,
                       .tier1_amount = 0,
                       .tier2_amount = 0};
}

ledger_result_t<bool> apply_check_in(vault_state_t& vault,
                                     const call_context_t& context) {
  if (auto error =
          check_preconditions(vault, operation_type_t::check_in, context)) {
    return *error;
  }
  vault.last_heartbeat = context.block_height;
  return true;
}

ledger_result_t<bool> apply_deposit(vault_state_t& vault,
                                    const call_context_t& context,
                                    const amount_t& amount) {
  if (auto error =
          check_preconditions(vault, operation_type_t::deposit, context)) {
    return *error;
  }
  if (amount == 0) {
    return vault_error_code::invalid_amount;
  }
  auto total = checked_add(vault.total_deposited, amount);
  if (!succeeded(total)) {
    return error_of(total);
  }
  auto split = split_tiers(std::get<amount_t>(total));
  if (!succeeded(split)) {
    return error_of(split);
  }

  vault.total_deposited = std::get<amount_t>(total);
  vault.tier1_amount = std::get<tier_split_t>(split).tier1;
  vault.tier2_amount = std::get<tier_split_t>(split).tier2;
  return true;
}

ledger_result_t<bool> apply_set_beneficiary(vault_state_t& vault,
                                            const call_context_t& context,
                                            const address_t& beneficiary) {
  if (auto error = check_preconditions(
          vault, operation_type_t::set_beneficiary, context)) {
    return *error;
  }
  if (auto error = validate_beneficiary(vault.owner, beneficiary)) {
    return *error;
  }
  vault.beneficiary = beneficiary;
  return true;
}

ledger_result_t<amount_t> apply_trigger_tier1(vault_state_t& vault,
                                              const call_context_t& context) {
  if (auto error = check_preconditions(vault, operation_type_t::trigger_tier1,
                                       context)) {
    return *error;
  }
  auto elapsed = elapsed_blocks(vault.last_heartbeat, context.block_height);
  if (!can_trigger_tier1(elapsed)) {
    return vault_error_code::timeout_not_reached;
  }
  vault.status = vault_status_t::tier1_released;
  return vault.tier1_amount;
}

ledger_result_t<amount_t> apply_trigger_tier2(vault_state_t& vault,
                                              const call_context_t& context) {
  if (auto error = check_preconditions(vault, operation_type_t::trigger_tier2,
                                       context)) {
    return *error;
  }
  auto elapsed = elapsed_blocks(vault.last_heartbeat, context.block_height);
  if (!can_trigger_tier2(elapsed)) {
    return vault_error_code::timeout_not_reached;
  }
  vault.status = vault_status_t::finalized;
  return vault.tier2_amount;
}

vault_status_view_t make_status_view(const vault_state_t& vault,
                                     const block_height_t current_block) {
  auto countdown = make_countdown(vault.last_heartbeat, current_block);
  return vault_status_view_t{.status = vault.status,
                             .last_heartbeat = vault.last_heartbeat,
                             .current_block = current_block,
                             .total_deposited = vault.total_deposited,
                             .tier1_amount = vault.tier1_amount,
                             .tier2_amount = vault.tier2_amount,
                             .tier1_blocks_remaining = countdown.tier1_remaining,
                             .tier2_blocks_remaining = countdown.tier2_remaining,
                             .owner = vault.owner};
}

}  // namespace sentinel::ledger
