#pragma once
#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/vault_status.hpp>

// Schema type: vault status view.
// Read-only bundle returned by get_status. Remaining-block countdowns are
// derived from last_heartbeat and current_block at query time.
namespace sentinel::schema {

template <uint16_t Version>
struct vault_status_view;

template <>
struct vault_status_view<1> final {
  uint16_t version{1};
  vault_status_t status{vault_status_t::uninitialized};
  block_height_t last_heartbeat{};
  block_height_t current_block{};
  amount_t total_deposited{};
  amount_t tier1_amount{};
  amount_t tier2_amount{};
  block_height_t tier1_blocks_remaining{};
  block_height_t tier2_blocks_remaining{};
  address_t owner{};

  bool operator==(const vault_status_view<1>&) const = default;
};

using vault_status_view_t = vault_status_view<1>;

}  // namespace sentinel::schema
