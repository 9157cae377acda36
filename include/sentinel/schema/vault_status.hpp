#pragma once

#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: vault status.
// Lifecycle of a vault. Values only ever move forward in declaration order.
namespace sentinel::schema {

enum class vault_status_t : uint8_t {
  uninitialized = 0,
  active = 1,
  tier1_released = 2,
  finalized = 3
};

inline constexpr auto kVaultStatusMappings = std::array{
    std::pair<std::string_view, vault_status_t>{"uninitialized",
                                                vault_status_t::uninitialized},
    std::pair<std::string_view, vault_status_t>{"active",
                                                vault_status_t::active},
    std::pair<std::string_view, vault_status_t>{"tier1_released",
                                                vault_status_t::tier1_released},
    std::pair<std::string_view, vault_status_t>{"finalized",
                                                vault_status_t::finalized},
};

template <>
inline std::optional<vault_status_t> try_from_string<vault_status_t>(
    const std::string_view value) {
  return from_string(value, kVaultStatusMappings);
}

inline constexpr std::string_view to_string(const vault_status_t value) {
  return to_string(value, kVaultStatusMappings).value_or("unknown");
}

}  // namespace sentinel::schema
