#pragma once

#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: vault error code.
// Ledger rejection taxonomy. Values are surfaced verbatim as transaction and
// query result codes, so they stay clear of the envelope error range.
namespace sentinel::schema {

enum class vault_error_code : uint32_t {
  not_owner = 100,
  invalid_state = 101,
  invalid_beneficiary = 102,
  invalid_amount = 103,
  timeout_not_reached = 104,
  vault_already_exists = 105,
  index_out_of_bounds = 106,
  arithmetic_overflow = 107,
};

inline constexpr auto kVaultErrorCodeMappings = std::array{
    std::pair<std::string_view, vault_error_code>{"not_owner",
                                                  vault_error_code::not_owner},
    std::pair<std::string_view, vault_error_code>{
        "invalid_state", vault_error_code::invalid_state},
    std::pair<std::string_view, vault_error_code>{
        "invalid_beneficiary", vault_error_code::invalid_beneficiary},
    std::pair<std::string_view, vault_error_code>{
        "invalid_amount", vault_error_code::invalid_amount},
    std::pair<std::string_view, vault_error_code>{
        "timeout_not_reached", vault_error_code::timeout_not_reached},
    std::pair<std::string_view, vault_error_code>{
        "vault_already_exists", vault_error_code::vault_already_exists},
    std::pair<std::string_view, vault_error_code>{
        "index_out_of_bounds", vault_error_code::index_out_of_bounds},
    std::pair<std::string_view, vault_error_code>{
        "arithmetic_overflow", vault_error_code::arithmetic_overflow},
};

inline constexpr std::string_view to_string(const vault_error_code value) {
  return to_string(value, kVaultErrorCodeMappings).value_or("unknown");
}

}  // namespace sentinel::schema
