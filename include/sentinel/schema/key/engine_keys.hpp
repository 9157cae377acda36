#pragma once

#include <array>
#include <boost/endian/buffers.hpp>
#include <cstdint>
#include <iterator>
#include <sentinel/schema/primitives.hpp>
#include <string_view>

// Schema key type: engine keys.
// Canonical key prefixes and key builders for vault records, configuration,
// signer nonces and transaction history.
namespace sentinel::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kConfigKeyPrefix{"SYS|STATE|CONFIG|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kVaultKeyPrefix{"SYS|STATE|VAULT|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};

inline const std::array<std::string_view, 5> kEngineKeyspaces{
    kStatePrefix, kConfigKeyPrefix, kNonceKeyPrefix, kVaultKeyPrefix,
    kHistoryPrefix};

template <typename Encoder, typename T>
sentinel::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
sentinel::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
sentinel::schema::bytes_t make_config_key(Encoder& encoder) {
  return make_prefix_key(encoder, kConfigKeyPrefix);
}

template <typename Encoder>
sentinel::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const sentinel::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

/// Single-vault records are keyed by owner address.
template <typename Encoder>
sentinel::schema::bytes_t make_vault_key(
    Encoder& encoder,
    const sentinel::schema::address_t& owner) {
  return make_prefixed_key(encoder, kVaultKeyPrefix, owner);
}

/// Multi-vault records are keyed by allocated id.
template <typename Encoder>
sentinel::schema::bytes_t make_vault_key(
    Encoder& encoder,
    const sentinel::schema::vault_id_t& vault_id) {
  return make_prefixed_key(encoder, kVaultKeyPrefix, vault_id);
}

/// History rows use big-endian (height, index) suffixes so a prefix scan
/// returns them in execution order.
template <typename Encoder>
sentinel::schema::bytes_t make_history_key(Encoder& encoder,
                                           const uint64_t height,
                                           const uint32_t index) {
  auto key = make_prefix_key(encoder, kHistoryPrefix);
  auto height_be = boost::endian::big_uint64_buf_t{height};
  auto index_be = boost::endian::big_uint32_buf_t{index};
  key.insert(std::end(key), height_be.data(),
             height_be.data() + sizeof(height_be));
  key.insert(std::end(key), index_be.data(),
             index_be.data() + sizeof(index_be));
  return key;
}

}  // namespace sentinel::schema::key
