#include <sentinel/common/critical.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>

namespace sentinel::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    sentinel::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  require_open();
  auto raw = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              std::string{detail::kCommittedStateKey}, &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to load committed state: {}", status.ToString());
    sentinel::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, sentinel::schema::hash32_t>>(
          sentinel::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(raw.data()), raw.size()});
  if (!decoded.has_value()) {
    sentinel::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  require_open();
  auto encoded = detail::encode_committed_state(state);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{},
      std::string{detail::kCommittedStateKey},
      detail::to_slice(sentinel::schema::bytes_view_t{encoded}));
  if (!status.ok()) {
    spdlog::error("Failed to persist committed state: {}", status.ToString());
    sentinel::common::critical("failed to persist committed state");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const sentinel::schema::bytes_view_t& prefix) const {
  require_open();

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_string); iterator->Valid(); iterator->Next()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    sentinel::common::critical("failed to list keys by prefix");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  require_open();

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(sentinel::schema::bytes_view_t{key}),
                  detail::to_slice(sentinel::schema::bytes_view_t{value}));
    if (!put_status.ok()) {
      sentinel::common::critical("failed staging key in commit batch");
    }
  }

  auto encoded_state = detail::encode_committed_state(state);
  auto state_status = batch.Put(
      std::string{detail::kCommittedStateKey},
      detail::to_slice(sentinel::schema::bytes_view_t{encoded_state}));
  if (!state_status.ok()) {
    sentinel::common::critical("failed staging committed state");
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to write commit batch: {}", write_status.ToString());
    sentinel::common::critical("failed to write commit batch");
  }
}

}  // namespace sentinel::storage
