#include <blake3.h>
#include <sentinel/blake3/hash.hpp>

namespace sentinel::blake3 {

namespace {

sentinel::schema::hash32_t finalize(blake3_hasher& hasher) {
  static_assert(BLAKE3_OUT_LEN == sizeof(sentinel::schema::hash32_t));
  auto output = sentinel::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

sentinel::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  return finalize(hasher);
}

sentinel::schema::hash32_t hash(const sentinel::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  return finalize(hasher);
}

sentinel::schema::hash32_t hash(
    std::initializer_list<sentinel::schema::bytes_view_t> parts) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  for (const auto& part : parts) {
    blake3_hasher_update(&hasher, part.data(), part.size());
  }
  return finalize(hasher);
}

}  // namespace sentinel::blake3
