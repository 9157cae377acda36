#pragma once
#include <sentinel/schema/primitives.hpp>
#include <optional>

namespace sentinel::schema {

template <uint16_t Version>
struct set_beneficiary;

template <>
struct set_beneficiary<1> final {
  uint16_t version{1};
  std::optional<vault_id_t> vault_id;
  address_t beneficiary{};
};

using set_beneficiary_t = set_beneficiary<1>;

}  // namespace sentinel::schema
