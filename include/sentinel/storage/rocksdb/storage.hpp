#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <sentinel/common/critical.hpp>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>
#include <tuple>

namespace sentinel::storage {

namespace detail {

using encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline sentinel::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const sentinel::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline sentinel::schema::bytes_t encode_committed_state(
    const committed_state& state) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{state.height, state.state_root});
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const sentinel::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const sentinel::schema::bytes_view_t& key,
           const T& value);

  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const sentinel::schema::bytes_view_t& prefix) const;
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;

 private:
  void require_open() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline void storage<rocksdb_storage_tag>::require_open() const {
  if (!database) {
    sentinel::common::critical("RocksDB database is not initialized");
  }
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const sentinel::schema::bytes_view_t& key) const {
  require_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    sentinel::common::critical("Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(sentinel::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const sentinel::schema::bytes_view_t& key,
    const T& value) {
  require_open();
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(sentinel::schema::bytes_view_t{encoded_value}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    sentinel::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace sentinel::storage
