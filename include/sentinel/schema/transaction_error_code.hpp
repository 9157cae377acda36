#pragma once

#include <cstdint>

namespace sentinel::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,
  ledger_model_mismatch = 7,
};

}  // namespace sentinel::schema
