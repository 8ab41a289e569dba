#pragma once
#include <trustee/schema/primitives.hpp>
#include <map>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace trustee::storage {

using key_value_entry_t =
    std::pair<trustee::schema::bytes_t, trustee::schema::bytes_t>;

/// Buffered mutations keyed by raw key; std::nullopt marks a delete.
using write_set_t =
    std::map<trustee::schema::bytes_t, std::optional<trustee::schema::bytes_t>>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  trustee::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const trustee::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const trustee::schema::bytes_view_t& key,
           const T& value) const;

  /// Raw value at key, or std::nullopt when missing.
  std::optional<trustee::schema::bytes_t> get_raw(
      const trustee::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const trustee::schema::bytes_view_t& prefix) const;

  /// Atomically apply buffered writes together with a new checkpoint.
  void apply(const write_set_t& writes, const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace trustee::storage
