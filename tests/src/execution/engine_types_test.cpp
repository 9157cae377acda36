#include <sentinel/execution/engine.hpp>
#include <gtest/gtest.h>

TEST(engine_types, defaults_are_stable) {
  auto tx = sentinel::schema::transaction_result_t{};
  EXPECT_EQ(tx.code, 0u);
  EXPECT_EQ(tx.gas_wanted, 0);
  EXPECT_EQ(tx.gas_used, 0);
  EXPECT_TRUE(tx.events.empty());

  auto block = sentinel::schema::block_result_t{};
  EXPECT_TRUE(block.tx_results.empty());

  auto commit = sentinel::schema::commit_result_t{};
  EXPECT_EQ(commit.retain_height, 0);
  EXPECT_EQ(commit.committed_height, 0);

  auto info = sentinel::schema::app_info_t{};
  EXPECT_EQ(info.data, "sentinel-vault-ledger");
  EXPECT_EQ(info.version, "0.1.0");
  EXPECT_EQ(info.last_block_height, 0);
}

TEST(engine_types, options_default_to_strict_multi_vault) {
  auto options = sentinel::execution::engine_options{};
  EXPECT_EQ(options.model, sentinel::schema::ledger_model_t::multi_vault);
  EXPECT_EQ(options.fee_amount, 10'000);
  EXPECT_TRUE(sentinel::schema::is_zero_address(options.fee_recipient));
  EXPECT_TRUE(options.require_strict_crypto);

  auto config = sentinel::schema::global_config_t{};
  EXPECT_EQ(config.next_vault_id, 1);
  EXPECT_EQ(config.total_vault_count, 0u);
}

TEST(engine_types, verifier_callback_type_compiles) {
  auto verifier = sentinel::execution::signature_verifier_t{
      [](const sentinel::schema::bytes_view_t&,
         const sentinel::schema::signer_id_t&,
         const sentinel::schema::signature_t&) { return true; }};
  EXPECT_TRUE(static_cast<bool>(verifier));
}
