#pragma once
#include <sentinel/schema/vault_ref.hpp>

// Schema type: trigger tier1.
// Open release of the first tranche once the owner has been silent for the
// tier1 threshold. Any signer may submit it.
namespace sentinel::schema {

template <uint16_t Version>
struct trigger_tier1;

template <>
struct trigger_tier1<1> final {
  uint16_t version{1};
  vault_ref_t target{};
};

using trigger_tier1_t = trigger_tier1<1>;

}  // namespace sentinel::schema
