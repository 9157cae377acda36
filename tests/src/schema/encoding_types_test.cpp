#include <gtest/gtest.h>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/schema/global_config.hpp>
#include <sentinel/schema/history_entry.hpp>
#include <sentinel/schema/key/engine_keys.hpp>
#include <sentinel/schema/transaction.hpp>
#include <sentinel/schema/vault_state.hpp>
#include <sentinel/schema/vault_status_view.hpp>
#include <sentinel/testing/common.hpp>

#include <algorithm>
#include <limits>
#include <string_view>
#include <tuple>
#include <vector>

using sentinel::testing::make_address;
using sentinel::testing::make_hash;

namespace {

using encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;

sentinel::schema::vault_state_t make_vault() {
  return sentinel::schema::vault_state_t{
      .vault_id = sentinel::schema::vault_id_t{7},
      .owner = make_address(1),
      .beneficiary = make_address(2),
      .status = sentinel::schema::vault_status_t::tier1_released,
      .last_heartbeat = 1'234,
      .total_deposited = 1'000'000,
      .tier1_amount = 100'000,
      .tier2_amount = 900'000};
}

}  // namespace

TEST(encoding_types, vault_state_round_trips) {
  auto encoder = encoder_t{};
  auto vault = make_vault();
  auto encoded = encoder.encode(vault);
  auto decoded = encoder.decode<sentinel::schema::vault_state_t>(
      sentinel::schema::bytes_view_t{encoded});
  EXPECT_EQ(decoded, vault);
}

TEST(encoding_types, vault_state_starts_with_version) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(make_vault());
  ASSERT_GE(encoded.size(), 2u);
  // u16 little endian version, then the 32-byte little endian vault id.
  EXPECT_EQ(encoded[0], 1u);
  EXPECT_EQ(encoded[1], 0u);
  EXPECT_EQ(encoded[2], 7u);
}

TEST(encoding_types, large_amounts_survive_encoding) {
  auto encoder = encoder_t{};
  auto config = sentinel::schema::global_config_t{
      .model = sentinel::schema::ledger_model_t::single_vault,
      .fee_amount = std::numeric_limits<sentinel::schema::amount_t>::max(),
      .fee_recipient = make_hash(9),
      .total_vault_count = 3,
      .next_vault_id = 4};
  auto decoded = encoder.decode<sentinel::schema::global_config_t>(
      sentinel::schema::bytes_view_t{encoder.encode(config)});
  EXPECT_EQ(decoded, config);
}

TEST(encoding_types, transaction_round_trips_each_payload) {
  auto encoder = encoder_t{};
  auto payloads = std::vector<sentinel::schema::transaction_payload_t>{
      sentinel::schema::create_vault_t{.beneficiary = make_address(2)},
      sentinel::schema::check_in_t{.vault_id = std::nullopt},
      sentinel::schema::deposit_t{.vault_id = sentinel::schema::vault_id_t{3},
                                  .amount = 42},
      sentinel::schema::set_beneficiary_t{.vault_id = std::nullopt,
                                          .beneficiary = make_address(4)},
      sentinel::schema::trigger_tier1_t{
          .target = sentinel::schema::vault_ref_t{make_address(1)}},
      sentinel::schema::trigger_tier2_t{
          .target =
              sentinel::schema::vault_ref_t{sentinel::schema::vault_id_t{9}}}};

  for (const auto& payload : payloads) {
    auto tx = sentinel::schema::transaction_t{
        .version = 1,
        .chain_id = make_hash(50),
        .nonce = 5,
        .signer = sentinel::schema::signer_id_t{make_address(1)},
        .payload = payload,
        .signature = sentinel::schema::ed25519_signature_t{}};
    auto encoded = encoder.encode(tx);
    auto decoded = encoder.try_decode<sentinel::schema::transaction_t>(
        sentinel::schema::bytes_view_t{encoded});
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->payload.index(), payload.index());
    EXPECT_EQ(sentinel::schema::operation_of(decoded->payload),
              sentinel::schema::operation_of(payload));
    EXPECT_EQ(encoder.encode(*decoded), encoded);
  }
}

TEST(encoding_types, try_decode_rejects_truncated_bytes) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(make_vault());
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(encoder
                   .try_decode<sentinel::schema::vault_state_t>(
                       sentinel::schema::bytes_view_t{encoded})
                   .has_value());
  EXPECT_FALSE(encoder
                   .try_decode<sentinel::schema::transaction_t>(
                       sentinel::schema::bytes_view_t{})
                   .has_value());
}

TEST(encoding_types, vault_keys_share_the_vault_prefix) {
  auto encoder = encoder_t{};
  auto prefix = sentinel::schema::key::make_prefix_key(
      encoder, sentinel::schema::key::kVaultKeyPrefix);
  auto by_owner = sentinel::schema::key::make_vault_key(encoder, make_address(1));
  auto by_id = sentinel::schema::key::make_vault_key(
      encoder, sentinel::schema::vault_id_t{1});

  EXPECT_TRUE(std::equal(std::begin(prefix), std::end(prefix),
                         std::begin(by_owner)));
  EXPECT_TRUE(
      std::equal(std::begin(prefix), std::end(prefix), std::begin(by_id)));
  EXPECT_EQ(by_owner.size(), prefix.size() + 32);
  EXPECT_EQ(by_id.size(), prefix.size() + 32);
  EXPECT_NE(sentinel::schema::key::make_config_key(encoder), prefix);
}

TEST(encoding_types, history_keys_sort_in_execution_order) {
  auto encoder = encoder_t{};
  auto keys = std::vector<sentinel::schema::bytes_t>{
      sentinel::schema::key::make_history_key(encoder, 1, 0),
      sentinel::schema::key::make_history_key(encoder, 1, 1),
      sentinel::schema::key::make_history_key(encoder, 1, 256),
      sentinel::schema::key::make_history_key(encoder, 2, 0),
      sentinel::schema::key::make_history_key(encoder, 256, 0)};
  EXPECT_TRUE(std::is_sorted(std::begin(keys), std::end(keys)));
}

TEST(encoding_types, history_entry_round_trips) {
  auto encoder = encoder_t{};
  auto entry = sentinel::schema::history_entry_t{
      .height = 12, .index = 3, .code = 104, .tx = {0x01, 0x02}};
  auto decoded = encoder.decode<sentinel::schema::history_entry_t>(
      sentinel::schema::bytes_view_t{encoder.encode(entry)});
  EXPECT_EQ(decoded.height, entry.height);
  EXPECT_EQ(decoded.index, entry.index);
  EXPECT_EQ(decoded.code, entry.code);
  EXPECT_EQ(decoded.tx, entry.tx);
}
