#include <gtest/gtest.h>
#include <sentinel/ledger/tier_split.hpp>

#include <limits>

using sentinel::ledger::checked_add;
using sentinel::ledger::error_of;
using sentinel::ledger::split_tiers;
using sentinel::ledger::succeeded;
using sentinel::ledger::tier_split_t;
using sentinel::schema::amount_t;
using sentinel::schema::vault_error_code;

namespace {

tier_split_t split(const amount_t& total) {
  auto result = split_tiers(total);
  EXPECT_TRUE(succeeded(result));
  return std::get<tier_split_t>(result);
}

}  // namespace

TEST(tier_split, zero_total_splits_to_zero) {
  auto tiers = split(amount_t{0});
  EXPECT_EQ(tiers.tier1, 0);
  EXPECT_EQ(tiers.tier2, 0);
}

TEST(tier_split, ten_percent_goes_to_tier1) {
  auto tiers = split(amount_t{1'000'000});
  EXPECT_EQ(tiers.tier1, 100'000);
  EXPECT_EQ(tiers.tier2, 900'000);
}

TEST(tier_split, tier1_rounds_down) {
  auto nine = split(amount_t{9});
  EXPECT_EQ(nine.tier1, 0);
  EXPECT_EQ(nine.tier2, 9);

  auto ten = split(amount_t{10});
  EXPECT_EQ(ten.tier1, 1);
  EXPECT_EQ(ten.tier2, 9);

  auto odd = split(amount_t{12'345});
  EXPECT_EQ(odd.tier1, 1'234);
  EXPECT_EQ(odd.tier2, 11'111);
}

TEST(tier_split, tiers_always_sum_to_total) {
  for (auto total : {1u, 7u, 99u, 101u, 999u, 10'001u, 4'294'967'295u}) {
    auto tiers = split(amount_t{total});
    EXPECT_EQ(amount_t{tiers.tier1 + tiers.tier2}, amount_t{total});
    EXPECT_LE(tiers.tier1, tiers.tier2);
  }
}

TEST(tier_split, totals_whose_product_overflows_are_rejected) {
  const auto max = std::numeric_limits<amount_t>::max();
  const auto largest_safe = amount_t{max / 1'000};

  EXPECT_TRUE(succeeded(split_tiers(largest_safe)));
  auto overflow = split_tiers(amount_t{largest_safe + 1});
  ASSERT_FALSE(succeeded(overflow));
  EXPECT_EQ(error_of(overflow), vault_error_code::arithmetic_overflow);
}

TEST(tier_split, checked_add_detects_wraparound) {
  const auto max = std::numeric_limits<amount_t>::max();
  auto sum = checked_add(amount_t{40}, amount_t{2});
  ASSERT_TRUE(succeeded(sum));
  EXPECT_EQ(std::get<amount_t>(sum), 42);

  EXPECT_TRUE(succeeded(checked_add(max, amount_t{0})));
  auto overflow = checked_add(max, amount_t{1});
  ASSERT_FALSE(succeeded(overflow));
  EXPECT_EQ(error_of(overflow), vault_error_code::arithmetic_overflow);
}
