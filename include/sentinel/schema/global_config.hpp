#pragma once
#include <sentinel/schema/ledger_model.hpp>
#include <sentinel/schema/primitives.hpp>

// Schema type: global config.
// Written once on first start and reloaded afterwards. The counters advance
// with every vault creation.
namespace sentinel::schema {

inline constexpr uint64_t kDefaultFeeAmount{10'000};

template <uint16_t Version>
struct global_config;

template <>
struct global_config<1> final {
  uint16_t version{1};
  ledger_model_t model{ledger_model_t::multi_vault};
  amount_t fee_amount{kDefaultFeeAmount};
  address_t fee_recipient{};
  uint64_t total_vault_count{};
  vault_id_t next_vault_id{1};

  bool operator==(const global_config<1>&) const = default;
};

using global_config_t = global_config<1>;

}  // namespace sentinel::schema
