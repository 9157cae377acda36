#pragma once

#include <cstdint>

// Schema type: query error code.
// Stable numeric codes for read-path failures that are not ledger rejections.
namespace sentinel::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

}  // namespace sentinel::schema
