#pragma once
#include <sentinel/schema/primitives.hpp>

// Schema type: create vault.
// Opens a vault owned by the transaction signer. The beneficiary must be
// non-zero and differ from the owner.
namespace sentinel::schema {

template <uint16_t Version>
struct create_vault;

template <>
struct create_vault<1> final {
  uint16_t version{1};
  address_t beneficiary{};
};

using create_vault_t = create_vault<1>;

}  // namespace sentinel::schema
