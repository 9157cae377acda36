#pragma once
#include <sentinel/schema/primitives.hpp>
#include <optional>

namespace sentinel::schema {

template <uint16_t Version>
struct deposit;

template <>
struct deposit<1> final {
  uint16_t version{1};
  std::optional<vault_id_t> vault_id;
  amount_t amount{};
};

using deposit_t = deposit<1>;

}  // namespace sentinel::schema
