#pragma once

#include <sentinel/schema/primitives.hpp>

namespace sentinel::ledger {

/// Blocks of owner silence before each tranche may be released. Both are
/// measured from the same last_heartbeat.
inline constexpr sentinel::schema::block_height_t kTier1ThresholdBlocks{26'280};
inline constexpr sentinel::schema::block_height_t kTier2ThresholdBlocks{52'560};

/// Blocks since the last heartbeat. Clamped to 0 when the supplied height
/// is behind the recorded heartbeat.
constexpr sentinel::schema::block_height_t elapsed_blocks(
    const sentinel::schema::block_height_t last_heartbeat,
    const sentinel::schema::block_height_t current_block) {
  return current_block >= last_heartbeat ? current_block - last_heartbeat : 0;
}

constexpr sentinel::schema::block_height_t blocks_remaining(
    const sentinel::schema::block_height_t threshold,
    const sentinel::schema::block_height_t elapsed) {
  return elapsed < threshold ? threshold - elapsed : 0;
}

constexpr bool can_trigger_tier1(
    const sentinel::schema::block_height_t elapsed) {
  return elapsed >= kTier1ThresholdBlocks;
}

constexpr bool can_trigger_tier2(
    const sentinel::schema::block_height_t elapsed) {
  return elapsed >= kTier2ThresholdBlocks;
}

struct countdown_t final {
  sentinel::schema::block_height_t elapsed{};
  sentinel::schema::block_height_t tier1_remaining{};
  sentinel::schema::block_height_t tier2_remaining{};
};

constexpr countdown_t make_countdown(
    const sentinel::schema::block_height_t last_heartbeat,
    const sentinel::schema::block_height_t current_block) {
  auto elapsed = elapsed_blocks(last_heartbeat, current_block);
  return countdown_t{
      .elapsed = elapsed,
      .tier1_remaining = blocks_remaining(kTier1ThresholdBlocks, elapsed),
      .tier2_remaining = blocks_remaining(kTier2ThresholdBlocks, elapsed)};
}

}  // namespace sentinel::ledger
