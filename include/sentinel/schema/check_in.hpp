#pragma once
#include <sentinel/schema/primitives.hpp>
#include <optional>

// Schema type: check in.
// Owner heartbeat. vault_id is required in the multi-vault model and must be
// absent in the single-vault model, where the caller's own vault is implied.
namespace sentinel::schema {

template <uint16_t Version>
struct check_in;

template <>
struct check_in<1> final {
  uint16_t version{1};
  std::optional<vault_id_t> vault_id;
};

using check_in_t = check_in<1>;

}  // namespace sentinel::schema
