#pragma once
#include <sentinel/schema/primitives.hpp>
#include <optional>
#include <vector>

namespace sentinel::storage {

using key_value_entry_t =
    std::pair<sentinel::schema::bytes_t, sentinel::schema::bytes_t>;

/// Last committed block checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  sentinel::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const sentinel::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const sentinel::schema::bytes_view_t& key,
           const T& value);

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const sentinel::schema::bytes_view_t& prefix) const;

  /// Atomically write entries together with the committed checkpoint.
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace sentinel::storage
