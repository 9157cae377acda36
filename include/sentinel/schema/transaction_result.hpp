#pragma once

#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction result.
// code 0 is success. Envelope failures use transaction_error_code, ledger
// rejections use vault_error_code. data carries the SCALE encoded ledger
// output (new vault id, released amount, ...).
namespace sentinel::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  int64_t gas_wanted{};
  int64_t gas_used{};
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace sentinel::schema
