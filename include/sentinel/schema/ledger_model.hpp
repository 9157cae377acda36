#pragma once

#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: ledger model.
// single_vault keys one vault per owner address; multi_vault allocates
// sequential ids and keeps a per-owner index.
namespace sentinel::schema {

enum class ledger_model_t : uint8_t { single_vault = 0, multi_vault = 1 };

inline constexpr auto kLedgerModelMappings = std::array{
    std::pair<std::string_view, ledger_model_t>{"single",
                                                ledger_model_t::single_vault},
    std::pair<std::string_view, ledger_model_t>{"multi",
                                                ledger_model_t::multi_vault},
};

template <>
inline std::optional<ledger_model_t> try_from_string<ledger_model_t>(
    const std::string_view value) {
  return from_string(value, kLedgerModelMappings);
}

inline constexpr std::string_view to_string(const ledger_model_t value) {
  return to_string(value, kLedgerModelMappings).value_or("unknown");
}

}  // namespace sentinel::schema
