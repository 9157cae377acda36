#include <gtest/gtest.h>
#include <sentinel/ledger/countdown.hpp>
#include <sentinel/ledger/multi_vault_ledger.hpp>
#include <sentinel/testing/common.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <limits>

using namespace sentinel::ledger;
using namespace sentinel::schema;
using sentinel::testing::make_address;

namespace {

using multi_ledger_t = ledger<multi_vault_tag>;

const auto kOwner = make_address(1);
const auto kHeir = make_address(2);
const auto kStranger = make_address(3);

call_context_t at(const address_t& caller, const block_height_t height) {
  return call_context_t{.caller = caller, .block_height = height};
}

multi_ledger_t make_ledger() {
  return multi_ledger_t{global_config_t{}};
}

vault_id_t create(multi_ledger_t& vaults,
                  const address_t& owner,
                  const block_height_t height,
                  const address_t& beneficiary = kHeir) {
  auto created = vaults.create_vault(at(owner, height), beneficiary);
  EXPECT_TRUE(succeeded(created));
  return std::get<vault_id_t>(created);
}

template <typename T>
vault_error_code rejection(const ledger_result_t<T>& result) {
  EXPECT_FALSE(succeeded(result));
  return error_of(result);
}

}  // namespace

TEST(multi_vault_ledger, new_vault_reports_full_countdown) {
  auto vaults = make_ledger();
  auto id = create(vaults, kOwner, 100);
  EXPECT_EQ(id, 1);

  auto status = vaults.get_status(id, 100);
  EXPECT_EQ(status.status, vault_status_t::active);
  EXPECT_EQ(status.last_heartbeat, 100u);
  EXPECT_EQ(status.current_block, 100u);
  EXPECT_EQ(status.total_deposited, 0);
  EXPECT_EQ(status.tier1_amount, 0);
  EXPECT_EQ(status.tier2_amount, 0);
  EXPECT_EQ(status.tier1_blocks_remaining, kTier1ThresholdBlocks);
  EXPECT_EQ(status.tier2_blocks_remaining, kTier2ThresholdBlocks);
  EXPECT_EQ(status.owner, kOwner);
  EXPECT_EQ(vaults.get_beneficiary(id), kHeir);
}

TEST(multi_vault_ledger, deposit_recomputes_tiers) {
  auto vaults = make_ledger();
  auto id = create(vaults, kOwner, 1);

  ASSERT_TRUE(succeeded(vaults.deposit(at(kOwner, 2), id, amount_t{1'000'000})));
  auto status = vaults.get_status(id, 2);
  EXPECT_EQ(status.total_deposited, 1'000'000);
  EXPECT_EQ(status.tier1_amount, 100'000);
  EXPECT_EQ(status.tier2_amount, 900'000);
}

TEST(multi_vault_ledger, small_deposits_floor_tier1) {
  auto vaults = make_ledger();
  auto id = create(vaults, kOwner, 1);

  ASSERT_TRUE(succeeded(vaults.deposit(at(kOwner, 2), id, amount_t{9})));
  EXPECT_EQ(vaults.get_status(id, 2).tier1_amount, 0);
  EXPECT_EQ(vaults.get_status(id, 2).tier2_amount, 9);

  ASSERT_TRUE(succeeded(vaults.deposit(at(kOwner, 3), id, amount_t{1})));
  EXPECT_EQ(vaults.get_status(id, 3).tier1_amount, 1);
  EXPECT_EQ(vaults.get_status(id, 3).tier2_amount, 9);
}

TEST(multi_vault_ledger, tier1_releases_exactly_at_threshold) {
  auto vaults = make_ledger();
  auto id = create(vaults, kOwner, 10);
  ASSERT_TRUE(succeeded(vaults.deposit(at(kOwner, 10), id, amount_t{500})));

  EXPECT_EQ(rejection(vaults.trigger_tier1(
                at(kStranger, 10 + kTier1ThresholdBlocks - 1), id)),
            vault_error_code::timeout_not_reached);

  auto released =
      vaults.trigger_tier1(at(kStranger, 10 + kTier1ThresholdBlocks), id);
  ASSERT_TRUE(succeeded(released));
  EXPECT_EQ(std::get<amount_t>(released), 50);
  EXPECT_EQ(vaults.get_status(id, 10 + kTier1ThresholdBlocks).status,
            vault_status_t::tier1_released);

  EXPECT_EQ(rejection(vaults.trigger_tier1(
                at(kStranger, 10 + kTier1ThresholdBlocks + 1), id)),
            vault_error_code::invalid_state);
}

TEST(multi_vault_ledger, tier2_counts_from_original_heartbeat) {
  auto vaults = make_ledger();
  auto id = create(vaults, kOwner, 0);
  ASSERT_TRUE(succeeded(vaults.deposit(at(kOwner, 0), id, amount_t{1'000})));

  EXPECT_EQ(rejection(vaults.trigger_tier2(at(kHeir, kTier2ThresholdBlocks), id)),
            vault_error_code::invalid_state);

  ASSERT_TRUE(
      succeeded(vaults.trigger_tier1(at(kHeir, kTier1ThresholdBlocks), id)));
  EXPECT_EQ(rejection(vaults.trigger_tier2(
                at(kHeir, kTier2ThresholdBlocks - 1), id)),
            vault_error_code::timeout_not_reached);

  auto released = vaults.trigger_tier2(at(kHeir, kTier2ThresholdBlocks), id);
  ASSERT_TRUE(succeeded(released));
  EXPECT_EQ(std::get<amount_t>(released), 900);
  EXPECT_EQ(vaults.get_status(id, kTier2ThresholdBlocks).status,
            vault_status_t::finalized);
}

TEST(multi_vault_ledger, check_in_resets_the_countdown) {
  auto vaults = make_ledger();
  auto id = create(vaults, kOwner, 0);

  ASSERT_TRUE(succeeded(vaults.check_in(at(kOwner, 26'000), id)));
  EXPECT_EQ(vaults.get_status(id, 26'000).last_heartbeat, 26'000u);
  EXPECT_EQ(
      rejection(vaults.trigger_tier1(at(kStranger, kTier1ThresholdBlocks), id)),
      vault_error_code::timeout_not_reached);
  EXPECT_EQ(vaults.get_status(id, kTier1ThresholdBlocks).tier1_blocks_remaining,
            26'000u);
}

TEST(multi_vault_ledger, owner_gated_operations_reject_other_callers) {
  auto vaults = make_ledger();
  auto id = create(vaults, kOwner, 1);

  EXPECT_EQ(rejection(vaults.check_in(at(kStranger, 2), id)),
            vault_error_code::not_owner);
  EXPECT_EQ(rejection(vaults.deposit(at(kStranger, 2), id, amount_t{5})),
            vault_error_code::not_owner);
  EXPECT_EQ(rejection(vaults.set_beneficiary(at(kStranger, 2), id, kStranger)),
            vault_error_code::not_owner);
  EXPECT_EQ(vaults.get_status(id, 2).last_heartbeat, 1u);
  EXPECT_EQ(vaults.get_status(id, 2).total_deposited, 0);
  EXPECT_EQ(vaults.get_beneficiary(id), kHeir);
}

TEST(multi_vault_ledger, status_guard_runs_before_owner_and_arguments) {
  auto vaults = make_ledger();
  auto id = create(vaults, kOwner, 0);
  ASSERT_TRUE(
      succeeded(vaults.trigger_tier1(at(kStranger, kTier1ThresholdBlocks), id)));

  // Released vault: a stranger with a zero amount still sees invalid_state.
  EXPECT_EQ(rejection(vaults.deposit(at(kStranger, kTier1ThresholdBlocks), id,
                                     amount_t{0})),
            vault_error_code::invalid_state);
  // Active vault: the owner guard fires before the amount guard.
  auto other = create(vaults, kOwner, 1);
  EXPECT_EQ(rejection(vaults.deposit(at(kStranger, 2), other, amount_t{0})),
            vault_error_code::not_owner);
  EXPECT_EQ(rejection(vaults.deposit(at(kOwner, 2), other, amount_t{0})),
            vault_error_code::invalid_amount);
}

TEST(multi_vault_ledger, beneficiary_must_be_nonzero_and_not_owner) {
  auto vaults = make_ledger();
  EXPECT_EQ(rejection(vaults.create_vault(at(kOwner, 1), address_t{})),
            vault_error_code::invalid_beneficiary);
  EXPECT_EQ(rejection(vaults.create_vault(at(kOwner, 1), kOwner)),
            vault_error_code::invalid_beneficiary);
  EXPECT_EQ(vaults.config().total_vault_count, 0u);
  EXPECT_EQ(vaults.config().next_vault_id, 1);

  auto id = create(vaults, kOwner, 1);
  EXPECT_EQ(rejection(vaults.set_beneficiary(at(kOwner, 2), id, kOwner)),
            vault_error_code::invalid_beneficiary);
  ASSERT_TRUE(succeeded(vaults.set_beneficiary(at(kOwner, 2), id, kStranger)));
  EXPECT_EQ(vaults.get_beneficiary(id), kStranger);
  // Changing the beneficiary is not a heartbeat.
  EXPECT_EQ(vaults.get_status(id, 2).last_heartbeat, 1u);
}

TEST(multi_vault_ledger, missing_vaults_are_uninitialized) {
  auto vaults = make_ledger();
  auto missing = vault_id_t{7};

  EXPECT_FALSE(vaults.has_vault(missing));
  EXPECT_FALSE(vaults.has_vault(vault_id_t{0}));
  EXPECT_EQ(rejection(vaults.check_in(at(kOwner, 1), missing)),
            vault_error_code::invalid_state);
  EXPECT_EQ(rejection(vaults.trigger_tier1(at(kOwner, 1'000'000), missing)),
            vault_error_code::invalid_state);

  auto status = vaults.get_status(missing, 5);
  EXPECT_EQ(status.status, vault_status_t::uninitialized);
  EXPECT_EQ(status.owner, address_t{});
  EXPECT_EQ(vaults.get_beneficiary(missing), address_t{});
}

TEST(multi_vault_ledger, ids_are_sequential_and_indexed_per_owner) {
  auto vaults = make_ledger();
  auto first = create(vaults, kOwner, 1);
  auto second = create(vaults, kStranger, 1);
  auto third = create(vaults, kOwner, 2);

  EXPECT_EQ(first, 1);
  EXPECT_EQ(second, 2);
  EXPECT_EQ(third, 3);
  EXPECT_EQ(vaults.config().total_vault_count, 3u);
  EXPECT_EQ(vaults.config().next_vault_id, 4);

  EXPECT_EQ(vaults.get_vault_count(kOwner), 2u);
  EXPECT_EQ(vaults.get_vault_count(kStranger), 1u);
  EXPECT_EQ(vaults.get_vault_count(kHeir), 0u);
  EXPECT_EQ(std::get<vault_id_t>(vaults.get_vault_id_by_index(kOwner, 0)),
            first);
  EXPECT_EQ(std::get<vault_id_t>(vaults.get_vault_id_by_index(kOwner, 1)),
            third);
  EXPECT_EQ(rejection(vaults.get_vault_id_by_index(kOwner, 2)),
            vault_error_code::index_out_of_bounds);
  EXPECT_EQ(rejection(vaults.get_vault_id_by_index(kHeir, 0)),
            vault_error_code::index_out_of_bounds);
}

TEST(multi_vault_ledger, vaults_of_one_owner_are_isolated) {
  auto vaults = make_ledger();
  auto first = create(vaults, kOwner, 0);
  auto second = create(vaults, kOwner, 0);

  ASSERT_TRUE(succeeded(vaults.deposit(at(kOwner, 1), first, amount_t{100})));
  ASSERT_TRUE(succeeded(vaults.check_in(at(kOwner, 500), first)));

  auto untouched = vaults.get_status(second, 500);
  EXPECT_EQ(untouched.total_deposited, 0);
  EXPECT_EQ(untouched.last_heartbeat, 0u);

  ASSERT_TRUE(
      succeeded(vaults.trigger_tier1(at(kHeir, kTier1ThresholdBlocks), second)));
  EXPECT_EQ(vaults.get_status(first, kTier1ThresholdBlocks).status,
            vault_status_t::active);
}

TEST(multi_vault_ledger, finalized_vaults_reject_everything) {
  auto vaults = make_ledger();
  auto id = create(vaults, kOwner, 0);
  ASSERT_TRUE(succeeded(vaults.deposit(at(kOwner, 1), id, amount_t{4'321})));
  ASSERT_TRUE(
      succeeded(vaults.trigger_tier1(at(kHeir, kTier1ThresholdBlocks), id)));
  ASSERT_TRUE(
      succeeded(vaults.trigger_tier2(at(kHeir, kTier2ThresholdBlocks), id)));

  auto drained = vaults.take_touched();
  ASSERT_EQ(drained.size(), 1u);
  const auto record = drained.front();
  EXPECT_EQ(record.status, vault_status_t::finalized);

  const auto later = block_height_t{kTier2ThresholdBlocks * 4};
  const auto view = vaults.get_status(id, later);
  const auto beneficiary = vaults.get_beneficiary(id);
  const auto config = vaults.config();

  EXPECT_EQ(rejection(vaults.check_in(at(kOwner, later), id)),
            vault_error_code::invalid_state);
  EXPECT_EQ(rejection(vaults.deposit(at(kOwner, later), id, amount_t{1})),
            vault_error_code::invalid_state);
  EXPECT_EQ(rejection(vaults.set_beneficiary(at(kOwner, later), id, kStranger)),
            vault_error_code::invalid_state);
  EXPECT_EQ(rejection(vaults.trigger_tier1(at(kHeir, later), id)),
            vault_error_code::invalid_state);
  EXPECT_EQ(rejection(vaults.trigger_tier2(at(kHeir, later), id)),
            vault_error_code::invalid_state);

  EXPECT_EQ(vaults.get_status(id, later), view);
  EXPECT_EQ(vaults.get_beneficiary(id), beneficiary);
  EXPECT_EQ(vaults.config(), config);
  EXPECT_TRUE(vaults.take_touched().empty());

  // The stored record is the one drained right after finalization.
  auto restored = make_ledger();
  restored.restore({record});
  EXPECT_EQ(restored.get_status(id, later), view);
  EXPECT_EQ(restored.get_beneficiary(id), beneficiary);
}

TEST(multi_vault_ledger, further_deposits_never_lower_either_tier) {
  auto vaults = make_ledger();
  auto id = create(vaults, kOwner, 0);

  auto previous = vaults.get_status(id, 0);
  auto height = block_height_t{1};
  for (const auto amount : {1, 8, 1, 3, 7, 90, 1, 999, 10, 12'345, 9}) {
    ASSERT_TRUE(
        succeeded(vaults.deposit(at(kOwner, height), id, amount_t{amount})));
    auto current = vaults.get_status(id, height);
    EXPECT_GE(current.tier1_amount, previous.tier1_amount) << amount;
    EXPECT_GE(current.tier2_amount, previous.tier2_amount) << amount;
    EXPECT_EQ(current.tier1_amount + current.tier2_amount,
              current.total_deposited);
    EXPECT_EQ(current.total_deposited,
              amount_t{previous.total_deposited + amount});
    previous = current;
    ++height;
  }
}

TEST(multi_vault_ledger, status_never_moves_backwards) {
  auto vaults = make_ledger();
  auto id = create(vaults, kOwner, 0);

  auto previous = vaults.get_status(id, 0).status;
  auto sample = [&](const block_height_t height) {
    auto current = vaults.get_status(id, height).status;
    EXPECT_GE(static_cast<uint8_t>(current), static_cast<uint8_t>(previous))
        << "at height " << height;
    previous = current;
  };

  static_cast<void>(vaults.trigger_tier2(at(kStranger, 10), id));
  sample(10);
  static_cast<void>(vaults.deposit(at(kOwner, 20), id, amount_t{500}));
  sample(20);
  static_cast<void>(vaults.trigger_tier1(at(kStranger, 30), id));
  sample(30);
  static_cast<void>(vaults.check_in(at(kOwner, 40), id));
  sample(40);
  static_cast<void>(vaults.set_beneficiary(at(kStranger, 50), id, kStranger));
  sample(50);
  static_cast<void>(
      vaults.trigger_tier1(at(kHeir, 40 + kTier1ThresholdBlocks), id));
  sample(40 + kTier1ThresholdBlocks);
  EXPECT_EQ(previous, vault_status_t::tier1_released);
  static_cast<void>(
      vaults.check_in(at(kOwner, 41 + kTier1ThresholdBlocks), id));
  sample(41 + kTier1ThresholdBlocks);
  static_cast<void>(
      vaults.trigger_tier1(at(kHeir, 42 + kTier1ThresholdBlocks), id));
  sample(42 + kTier1ThresholdBlocks);
  static_cast<void>(
      vaults.trigger_tier2(at(kHeir, 40 + kTier2ThresholdBlocks), id));
  sample(40 + kTier2ThresholdBlocks);
  EXPECT_EQ(previous, vault_status_t::finalized);
  static_cast<void>(
      vaults.deposit(at(kOwner, 41 + kTier2ThresholdBlocks), id, amount_t{1}));
  sample(41 + kTier2ThresholdBlocks);
  EXPECT_EQ(previous, vault_status_t::finalized);
}

TEST(multi_vault_ledger, overflowing_deposit_leaves_vault_unchanged) {
  auto vaults = make_ledger();
  auto id = create(vaults, kOwner, 0);
  const auto max = std::numeric_limits<amount_t>::max();

  ASSERT_TRUE(succeeded(vaults.deposit(at(kOwner, 1), id, amount_t{10})));
  EXPECT_EQ(rejection(vaults.deposit(at(kOwner, 2), id, max)),
            vault_error_code::arithmetic_overflow);
  EXPECT_EQ(rejection(vaults.deposit(at(kOwner, 2), id, amount_t{max / 100})),
            vault_error_code::arithmetic_overflow);
  EXPECT_EQ(vaults.get_status(id, 2).total_deposited, 10);
  EXPECT_EQ(vaults.get_status(id, 2).tier1_amount, 1);
}

TEST(multi_vault_ledger, touched_records_are_drained_in_id_order) {
  auto vaults = make_ledger();
  auto first = create(vaults, kOwner, 0);
  auto second = create(vaults, kStranger, 0);
  auto drained = vaults.take_touched();
  ASSERT_EQ(drained.size(), 2u);
  EXPECT_EQ(drained[0].vault_id, first);
  EXPECT_EQ(drained[1].vault_id, second);
  EXPECT_TRUE(vaults.take_touched().empty());

  EXPECT_FALSE(succeeded(vaults.check_in(at(kStranger, 1), first)));
  EXPECT_TRUE(vaults.take_touched().empty());
  ASSERT_TRUE(succeeded(vaults.check_in(at(kStranger, 1), second)));
  drained = vaults.take_touched();
  ASSERT_EQ(drained.size(), 1u);
  EXPECT_EQ(drained[0].last_heartbeat, 1u);
}

TEST(multi_vault_ledger, restore_rebuilds_owner_index) {
  auto source = make_ledger();
  create(source, kOwner, 0);
  create(source, kStranger, 0);
  create(source, kOwner, 0);
  auto records = source.take_touched();
  std::reverse(std::begin(records), std::end(records));

  auto restored = multi_ledger_t{source.config()};
  restored.restore(records);
  EXPECT_EQ(restored.get_vault_count(kOwner), 2u);
  EXPECT_EQ(std::get<vault_id_t>(restored.get_vault_id_by_index(kOwner, 1)), 3);
  EXPECT_TRUE(restored.has_vault(vault_id_t{2}));
  EXPECT_TRUE(restored.take_touched().empty());

  // The allocator continues after the restored ids.
  EXPECT_EQ(create(restored, kHeir, 1, kOwner), 4);
}
