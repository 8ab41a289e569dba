#pragma once

#include <trustee/common/critical.hpp>
#include <trustee/schema/encoding/scale/encoder.hpp>
#include <trustee/schema/primitives.hpp>
#include <trustee/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace trustee::execution {

/// Layered write buffer over committed storage.
///
/// The bottom layer holds everything written since the last commit. Each call
/// pushes a scope on top; a scope is either merged into the layer below or
/// dropped, which is how a failed call leaves no trace. Reads consult the
/// scopes from the top down and fall through to storage.
class state_buffer final {
 public:
  using encoder_t = trustee::schema::encoding::scale_encoder_t;
  using storage_t =
      trustee::storage::storage<trustee::storage::rocksdb_storage_tag>;

  state_buffer(encoder_t& encoder, storage_t& storage);

  std::optional<trustee::schema::bytes_t> get(
      const trustee::schema::bytes_view_t& key) const;
  void put(const trustee::schema::bytes_view_t& key,
           trustee::schema::bytes_t value);
  void erase(const trustee::schema::bytes_view_t& key);

  /// Live entries under prefix, ordered by key, with buffered writes applied.
  std::vector<trustee::storage::key_value_entry_t> list_by_prefix(
      const trustee::schema::bytes_view_t& prefix) const;

  template <typename T>
  std::optional<T> load(const trustee::schema::bytes_view_t& key) const;

  template <typename T>
  void store(const trustee::schema::bytes_view_t& key, const T& value);

  void push_scope();
  void merge_scope();
  void drop_scope();
  std::size_t depth() const;

  /// Hand the bottom layer over for a storage commit and start a fresh one.
  trustee::storage::write_set_t take_writes();

  encoder_t& encoder() const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
  std::vector<trustee::storage::write_set_t> scopes_;
};

/// Pushes a scope on construction; drops it on destruction unless committed.
class write_scope final {
 public:
  explicit write_scope(state_buffer& state);
  ~write_scope();

  write_scope(const write_scope&) = delete;
  write_scope& operator=(const write_scope&) = delete;

  void commit();

 private:
  state_buffer& state_;
  bool done_{false};
};

template <typename T>
std::optional<T> state_buffer::load(
    const trustee::schema::bytes_view_t& key) const {
  auto raw = get(key);
  if (!raw) {
    return std::nullopt;
  }
  auto decoded = encoder_.try_decode<T>(
      trustee::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded) {
    trustee::common::critical("failed to decode persisted state row");
  }
  return decoded;
}

template <typename T>
void state_buffer::store(const trustee::schema::bytes_view_t& key,
                         const T& value) {
  put(key, encoder_.encode(value));
}

}  // namespace trustee::execution
