#pragma once
#include <sentinel/schema/primitives.hpp>

#include <variant>

namespace sentinel::schema {

/// Addresses a vault by owner (single-vault model) or by id (multi-vault
/// model). The engine rejects the shape that does not match its model.
using vault_ref_t = std::variant<address_t, vault_id_t>;

}  // namespace sentinel::schema
