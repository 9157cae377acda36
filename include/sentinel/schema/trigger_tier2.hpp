#pragma once
#include <sentinel/schema/vault_ref.hpp>

namespace sentinel::schema {

template <uint16_t Version>
struct trigger_tier2;

template <>
struct trigger_tier2<1> final {
  uint16_t version{1};
  vault_ref_t target{};
};

using trigger_tier2_t = trigger_tier2<1>;

}  // namespace sentinel::schema
