#pragma once
#include <sentinel/common/critical.hpp>
#include <sentinel/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

// Schema records are plain aggregates, so SCALE encodes them field by field
// in declaration order. Reordering or inserting a field changes the wire
// format and requires a new record version.
namespace sentinel::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  sentinel::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, sentinel::schema::bytes_t& out);

  template <typename T>
  T decode(const sentinel::schema::bytes_view_t& bytes);

  /// Decode untrusted bytes; std::nullopt instead of terminating on failure.
  template <typename T>
  std::optional<T> try_decode(const sentinel::schema::bytes_view_t& bytes);
};

template <typename T>
sentinel::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    sentinel::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        sentinel::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const sentinel::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    sentinel::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const sentinel::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace sentinel::schema::encoding
