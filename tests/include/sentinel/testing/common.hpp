#pragma once

#include <sentinel/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace sentinel::testing {

inline sentinel::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = sentinel::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Address with only the first byte set; never the zero address for seed > 0.
inline sentinel::schema::address_t make_address(const uint8_t seed) {
  auto address = sentinel::schema::address_t{};
  address[0] = seed;
  return address;
}

inline sentinel::schema::signer_id_t make_named_signer(const uint8_t seed) {
  return sentinel::schema::signer_id_t{make_address(seed)};
}

inline sentinel::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = sentinel::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace sentinel::testing
