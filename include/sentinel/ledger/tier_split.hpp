#pragma once

#include <sentinel/ledger/ledger_result.hpp>
#include <sentinel/schema/primitives.hpp>

#include <cstdint>

namespace sentinel::ledger {

inline constexpr uint64_t kTier1BasisPoints{1'000};
inline constexpr uint64_t kBasisPointsDenominator{10'000};

struct tier_split_t final {
  sentinel::schema::amount_t tier1{};
  sentinel::schema::amount_t tier2{};

  bool operator==(const tier_split_t&) const = default;
};

/// tier1 = floor(total * 1000 / 10000), tier2 = total - tier1.
///
/// Multiplies before dividing. Fails with arithmetic_overflow when
/// total * 1000 does not fit in 256 bits.
ledger_result_t<tier_split_t> split_tiers(
    const sentinel::schema::amount_t& total);

/// lhs + rhs, or arithmetic_overflow when the sum exceeds 256 bits.
ledger_result_t<sentinel::schema::amount_t> checked_add(
    const sentinel::schema::amount_t& lhs,
    const sentinel::schema::amount_t& rhs);

}  // namespace sentinel::ledger
