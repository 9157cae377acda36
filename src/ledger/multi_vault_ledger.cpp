#include <sentinel/common/critical.hpp>
#include <sentinel/ledger/multi_vault_ledger.hpp>
#include <sentinel/ledger/vault_machine.hpp>

#include <algorithm>
#include <utility>

using namespace sentinel::schema;

namespace sentinel::ledger {

ledger<multi_vault_tag>::ledger(global_config_t config)
    : config_{std::move(config)} {}

ledger_result_t<vault_id_t> ledger<multi_vault_tag>::create_vault(
    const call_context_t& context,
    const address_t& beneficiary) {
  if (auto error = validate_beneficiary(context.caller, beneficiary)) {
    return *error;
  }

  auto vault_id = config_.next_vault_id;
  arena_.push_back(open_vault(vault_id, context, beneficiary));
  owner_index_[context.caller].push_back(vault_id);
  touched_.insert(arena_.size() - 1);
  ++config_.next_vault_id;
  ++config_.total_vault_count;
  return vault_id;
}

ledger_result_t<bool> ledger<multi_vault_tag>::check_in(
    const call_context_t& context,
    const vault_id_t& vault_id) {
  auto slot = slot_of(vault_id);
  if (!slot) {
    auto missing = vault_state_t{};
    return apply_check_in(missing, context);
  }
  auto result = apply_check_in(arena_[*slot], context);
  if (succeeded(result)) {
    touched_.insert(*slot);
  }
  return result;
}

ledger_result_t<bool> ledger<multi_vault_tag>::deposit(
    const call_context_t& context,
    const vault_id_t& vault_id,
    const amount_t& amount) {
  auto slot = slot_of(vault_id);
  if (!slot) {
    auto missing = vault_state_t{};
    return apply_deposit(missing, context, amount);
  }
  auto result = apply_deposit(arena_[*slot], context, amount);
  if (succeeded(result)) {
    touched_.insert(*slot);
  }
  return result;
}

ledger_result_t<bool> ledger<multi_vault_tag>::set_beneficiary(
    const call_context_t& context,
    const vault_id_t& vault_id,
    const address_t& beneficiary) {
  auto slot = slot_of(vault_id);
  if (!slot) {
    auto missing = vault_state_t{};
    return apply_set_beneficiary(missing, context, beneficiary);
  }
  auto result = apply_set_beneficiary(arena_[*slot], context, beneficiary);
  if (succeeded(result)) {
    touched_.insert(*slot);
  }
  return result;
}

ledger_result_t<amount_t> ledger<multi_vault_tag>::trigger_tier1(
    const call_context_t& context,
    const vault_id_t& vault_id) {
  auto slot = slot_of(vault_id);
  if (!slot) {
    return vault_error_code::invalid_state;
  }
  auto result = apply_trigger_tier1(arena_[*slot], context);
  if (succeeded(result)) {
    touched_.insert(*slot);
  }
  return result;
}

ledger_result_t<amount_t> ledger<multi_vault_tag>::trigger_tier2(
    const call_context_t& context,
    const vault_id_t& vault_id) {
  auto slot = slot_of(vault_id);
  if (!slot) {
    return vault_error_code::invalid_state;
  }
  auto result = apply_trigger_tier2(arena_[*slot], context);
  if (succeeded(result)) {
    touched_.insert(*slot);
  }
  return result;
}

vault_status_view_t ledger<multi_vault_tag>::get_status(
    const vault_id_t& vault_id,
    const block_height_t current_block) const {
  auto slot = slot_of(vault_id);
  return make_status_view(slot ? arena_[*slot] : vault_state_t{},
                          current_block);
}

address_t ledger<multi_vault_tag>::get_beneficiary(
    const vault_id_t& vault_id) const {
  auto slot = slot_of(vault_id);
  return slot ? arena_[*slot].beneficiary : address_t{};
}

bool ledger<multi_vault_tag>::has_vault(const vault_id_t& vault_id) const {
  return slot_of(vault_id).has_value();
}

uint64_t ledger<multi_vault_tag>::get_vault_count(
    const address_t& owner) const {
  auto it = owner_index_.find(owner);
  return it == std::end(owner_index_) ? 0 : it->second.size();
}

ledger_result_t<vault_id_t> ledger<multi_vault_tag>::get_vault_id_by_index(
    const address_t& owner,
    const uint64_t index) const {
  auto it = owner_index_.find(owner);
  if (it == std::end(owner_index_) || index >= it->second.size()) {
    return vault_error_code::index_out_of_bounds;
  }
  return it->second[index];
}

amount_t ledger<multi_vault_tag>::get_fee_amount() const {
  return config_.fee_amount;
}

const global_config_t& ledger<multi_vault_tag>::config() const {
  return config_;
}

std::vector<vault_state_t> ledger<multi_vault_tag>::take_touched() {
  auto out = std::vector<vault_state_t>{};
  out.reserve(touched_.size());
  for (const auto slot : touched_) {
    out.push_back(arena_[slot]);
  }
  touched_.clear();
  return out;
}

void ledger<multi_vault_tag>::restore(std::vector<vault_state_t> vaults) {
  std::sort(std::begin(vaults), std::end(vaults),
            [](const vault_state_t& lhs, const vault_state_t& rhs) {
              return lhs.vault_id < rhs.vault_id;
            });
  arena_ = std::move(vaults);
  touched_.clear();
  owner_index_.clear();
  // Ids are allocated in creation order, so id order rebuilds each owner's
  // list in creation order.
  for (std::size_t slot = 0; slot < arena_.size(); ++slot) {
    const auto& vault = arena_[slot];
    if (vault.vault_id != slot + 1) {
      sentinel::common::critical("persisted vault ids are not dense");
    }
    owner_index_[vault.owner].push_back(vault.vault_id);
  }
}

// Vault id N lives in arena slot N - 1.
std::optional<std::size_t> ledger<multi_vault_tag>::slot_of(
    const vault_id_t& vault_id) const {
  if (vault_id == 0 || vault_id > arena_.size()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(vault_id - 1);
}

}  // namespace sentinel::ledger
