#pragma once

#include <sentinel/schema/primitives.hpp>

namespace sentinel::ledger {

/// Caller identity and block height of one ledger call. Both are supplied by
/// the host; the ledger never reads a clock.
struct call_context_t final {
  sentinel::schema::address_t caller{};
  sentinel::schema::block_height_t block_height{};
};

}  // namespace sentinel::ledger
