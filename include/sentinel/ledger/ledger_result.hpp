#pragma once

#include <sentinel/schema/vault_error_code.hpp>

#include <variant>

namespace sentinel::ledger {

/// Ledger entry points return either their output or the rejection reason.
/// A rejected call leaves every vault untouched.
template <typename T>
using ledger_result_t = std::variant<T, sentinel::schema::vault_error_code>;

template <typename T>
bool succeeded(const ledger_result_t<T>& result) {
  return std::holds_alternative<T>(result);
}

template <typename T>
sentinel::schema::vault_error_code error_of(const ledger_result_t<T>& result) {
  return std::get<sentinel::schema::vault_error_code>(result);
}

}  // namespace sentinel::ledger
