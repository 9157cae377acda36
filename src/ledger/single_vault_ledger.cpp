#include <sentinel/ledger/single_vault_ledger.hpp>
#include <sentinel/ledger/vault_machine.hpp>

#include <utility>

using namespace sentinel::schema;

namespace sentinel::ledger {

namespace {

// Missing vaults are treated as uninitialized records so the status guard
// rejects them before anything else.
template <typename Apply>
auto apply_to(vault_state_t* vault,
              std::set<address_t>& touched,
              const address_t& owner,
              Apply&& apply) {
  auto missing = vault_state_t{};
  auto& target = vault != nullptr ? *vault : missing;
  auto result = std::forward<Apply>(apply)(target);
  if (vault != nullptr && result.index() == 0) {
    touched.insert(owner);
  }
  return result;
}

}  // namespace

ledger<single_vault_tag>::ledger(global_config_t config)
    : config_{std::move(config)} {}

ledger_result_t<bool> ledger<single_vault_tag>::create_vault(
    const call_context_t& context,
    const address_t& beneficiary) {
  if (find(context.caller) != nullptr) {
    return vault_error_code::vault_already_exists;
  }
  if (auto error = validate_beneficiary(context.caller, beneficiary)) {
    return *error;
  }
  vaults_.emplace(context.caller,
                  open_vault(vault_id_t{0}, context, beneficiary));
  touched_.insert(context.caller);
  ++config_.total_vault_count;
  return true;
}

ledger_result_t<bool> ledger<single_vault_tag>::check_in(
    const call_context_t& context) {
  return apply_to(find(context.caller), touched_, context.caller,
                  [&](vault_state_t& vault) {
                    return apply_check_in(vault, context);
                  });
}

ledger_result_t<bool> ledger<single_vault_tag>::deposit(
    const call_context_t& context,
    const amount_t& amount) {
  return apply_to(find(context.caller), touched_, context.caller,
                  [&](vault_state_t& vault) {
                    return apply_deposit(vault, context, amount);
                  });
}

ledger_result_t<bool> ledger<single_vault_tag>::set_beneficiary(
    const call_context_t& context,
    const address_t& beneficiary) {
  return apply_to(find(context.caller), touched_, context.caller,
                  [&](vault_state_t& vault) {
                    return apply_set_beneficiary(vault, context, beneficiary);
                  });
}

ledger_result_t<amount_t> ledger<single_vault_tag>::trigger_tier1(
    const call_context_t& context,
    const address_t& owner) {
  return apply_to(find(owner), touched_, owner, [&](vault_state_t& vault) {
    return apply_trigger_tier1(vault, context);
  });
}

ledger_result_t<amount_t> ledger<single_vault_tag>::trigger_tier2(
    const call_context_t& context,
    const address_t& owner) {
  return apply_to(find(owner), touched_, owner, [&](vault_state_t& vault) {
    return apply_trigger_tier2(vault, context);
  });
}

vault_status_view_t ledger<single_vault_tag>::get_status(
    const address_t& owner,
    const block_height_t current_block) const {
  const auto* vault = find(owner);
  return make_status_view(vault != nullptr ? *vault : vault_state_t{},
                          current_block);
}

address_t ledger<single_vault_tag>::get_beneficiary(
    const address_t& owner) const {
  const auto* vault = find(owner);
  return vault != nullptr ? vault->beneficiary : address_t{};
}

bool ledger<single_vault_tag>::has_vault(const address_t& owner) const {
  return find(owner) != nullptr;
}

amount_t ledger<single_vault_tag>::get_fee_amount() const {
  return config_.fee_amount;
}

const global_config_t& ledger<single_vault_tag>::config() const {
  return config_;
}

std::vector<vault_state_t> ledger<single_vault_tag>::take_touched() {
  auto out = std::vector<vault_state_t>{};
  out.reserve(touched_.size());
  for (const auto& owner : touched_) {
    out.push_back(vaults_.at(owner));
  }
  touched_.clear();
  return out;
}

void ledger<single_vault_tag>::restore(std::vector<vault_state_t> vaults) {
  vaults_.clear();
  touched_.clear();
  for (auto& vault : vaults) {
    auto owner = vault.owner;
    vaults_.insert_or_assign(owner, std::move(vault));
  }
}

vault_state_t* ledger<single_vault_tag>::find(const address_t& owner) {
  auto it = vaults_.find(owner);
  return it == std::end(vaults_) ? nullptr : &it->second;
}

const vault_state_t* ledger<single_vault_tag>::find(
    const address_t& owner) const {
  auto it = vaults_.find(owner);
  return it == std::end(vaults_) ? nullptr : &it->second;
}

}  // namespace sentinel::ledger
