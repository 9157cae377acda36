#include <sentinel/ledger/tier_split.hpp>

#include <limits>

namespace sentinel::ledger {

ledger_result_t<tier_split_t> split_tiers(
    const sentinel::schema::amount_t& total) {
  static const auto kMaxMultiplicand = sentinel::schema::amount_t{
      std::numeric_limits<sentinel::schema::amount_t>::max() /
      kTier1BasisPoints};
  if (total > kMaxMultiplicand) {
    return sentinel::schema::vault_error_code::arithmetic_overflow;
  }
  auto tier1 = sentinel::schema::amount_t{(total * kTier1BasisPoints) /
                                          kBasisPointsDenominator};
  return tier_split_t{.tier1 = tier1,
                      .tier2 = sentinel::schema::amount_t{total - tier1}};
}

ledger_result_t<sentinel::schema::amount_t> checked_add(
    const sentinel::schema::amount_t& lhs,
    const sentinel::schema::amount_t& rhs) {
  if (rhs > std::numeric_limits<sentinel::schema::amount_t>::max() - lhs) {
    return sentinel::schema::vault_error_code::arithmetic_overflow;
  }
  return sentinel::schema::amount_t{lhs + rhs};
}

}  // namespace sentinel::ledger
