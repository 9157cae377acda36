#pragma once

#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: operation type.
// Classifies ledger entry points. Ownership gating is a property of the
// operation kind: the tier triggers are open to any caller.
namespace sentinel::schema {

enum class operation_type_t : uint8_t {
  create_vault = 0,
  check_in = 1,
  deposit = 2,
  set_beneficiary = 3,
  trigger_tier1 = 4,
  trigger_tier2 = 5,
};

inline constexpr auto kOperationTypeMappings = std::array{
    std::pair<std::string_view, operation_type_t>{
        "create_vault", operation_type_t::create_vault},
    std::pair<std::string_view, operation_type_t>{"check_in",
                                                  operation_type_t::check_in},
    std::pair<std::string_view, operation_type_t>{"deposit",
                                                  operation_type_t::deposit},
    std::pair<std::string_view, operation_type_t>{
        "set_beneficiary", operation_type_t::set_beneficiary},
    std::pair<std::string_view, operation_type_t>{
        "trigger_tier1", operation_type_t::trigger_tier1},
    std::pair<std::string_view, operation_type_t>{
        "trigger_tier2", operation_type_t::trigger_tier2},
};

template <>
inline std::optional<operation_type_t> try_from_string<operation_type_t>(
    const std::string_view value) {
  return from_string(value, kOperationTypeMappings);
}

inline constexpr std::string_view to_string(const operation_type_t value) {
  return to_string(value, kOperationTypeMappings).value_or("unknown");
}

/// Only the owner of the addressed vault may invoke the operation.
inline constexpr bool requires_owner(const operation_type_t value) {
  switch (value) {
    case operation_type_t::check_in:
    case operation_type_t::deposit:
    case operation_type_t::set_beneficiary:
      return true;
    case operation_type_t::create_vault:
    case operation_type_t::trigger_tier1:
    case operation_type_t::trigger_tier2:
      return false;
  }
  return true;
}

}  // namespace sentinel::schema
