#pragma once
#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/vault_status.hpp>

// Schema type: vault state.
// Persisted vault record. tier1_amount + tier2_amount == total_deposited at
// all times; id is 0 for single-vault records, which are keyed by owner.
namespace sentinel::schema {

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  address_t owner{};
  address_t beneficiary{};
  vault_status_t status{vault_status_t::uninitialized};
  block_height_t last_heartbeat{};
  amount_t total_deposited{};
  amount_t tier1_amount{};
  amount_t tier2_amount{};

  bool operator==(const vault_state<1>&) const = default;
};

using vault_state_t = vault_state<1>;

}  // namespace sentinel::schema
