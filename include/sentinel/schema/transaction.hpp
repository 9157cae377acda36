#pragma once
#include <sentinel/schema/check_in.hpp>
#include <sentinel/schema/create_vault.hpp>
#include <sentinel/schema/deposit.hpp>
#include <sentinel/schema/operation_type.hpp>
#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/set_beneficiary.hpp>
#include <sentinel/schema/trigger_tier1.hpp>
#include <sentinel/schema/trigger_tier2.hpp>
#include <tuple>
#include <variant>

namespace sentinel::schema {

using transaction_payload_t = std::variant<create_vault_t,
                                           check_in_t,
                                           deposit_t,
                                           set_beneficiary_t,
                                           trigger_tier1_t,
                                           trigger_tier2_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

/// Bytes a signer signs: every envelope field except the signature, in
/// envelope order.
template <typename Encoder>
bytes_t signing_bytes(Encoder& encoder, const transaction_t& tx) {
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

/// Operation kind carried by a payload alternative.
inline operation_type_t operation_of(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const create_vault_t&) { return operation_type_t::create_vault; },
          [](const check_in_t&) { return operation_type_t::check_in; },
          [](const deposit_t&) { return operation_type_t::deposit; },
          [](const set_beneficiary_t&) {
            return operation_type_t::set_beneficiary;
          },
          [](const trigger_tier1_t&) {
            return operation_type_t::trigger_tier1;
          },
          [](const trigger_tier2_t&) {
            return operation_type_t::trigger_tier2;
          }},
      payload);
}

}  // namespace sentinel::schema
