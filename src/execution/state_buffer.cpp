#include <trustee/execution/state_buffer.hpp>
#include <algorithm>
#include <iterator>
#include <map>
#include <ranges>
#include <utility>

namespace trustee::execution {

namespace {

bool has_prefix(const trustee::schema::bytes_t& key,
                const trustee::schema::bytes_view_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

}  // namespace

state_buffer::state_buffer(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage}, scopes_(1) {}

std::optional<trustee::schema::bytes_t> state_buffer::get(
    const trustee::schema::bytes_view_t& key) const {
  auto owned = trustee::schema::make_bytes(key);
  for (const auto& scope : std::views::reverse(scopes_)) {
    auto it = scope.find(owned);
    if (it != std::end(scope)) {
      return it->second;
    }
  }
  return storage_.get_raw(key);
}

void state_buffer::put(const trustee::schema::bytes_view_t& key,
                       trustee::schema::bytes_t value) {
  scopes_.back()[trustee::schema::make_bytes(key)] = std::move(value);
}

void state_buffer::erase(const trustee::schema::bytes_view_t& key) {
  scopes_.back()[trustee::schema::make_bytes(key)] = std::nullopt;
}

std::vector<trustee::storage::key_value_entry_t> state_buffer::list_by_prefix(
    const trustee::schema::bytes_view_t& prefix) const {
  auto merged = std::map<trustee::schema::bytes_t,
                         std::optional<trustee::schema::bytes_t>>{};
  for (auto& [key, value] : storage_.list_by_prefix(prefix)) {
    merged[std::move(key)] = std::move(value);
  }
  for (const auto& scope : scopes_) {
    for (auto it = scope.lower_bound(trustee::schema::make_bytes(prefix));
         it != std::end(scope) && has_prefix(it->first, prefix); ++it) {
      merged[it->first] = it->second;
    }
  }

  auto entries = std::vector<trustee::storage::key_value_entry_t>{};
  entries.reserve(merged.size());
  for (auto& [key, value] : merged) {
    if (value) {
      entries.emplace_back(key, std::move(*value));
    }
  }
  return entries;
}

void state_buffer::push_scope() {
  scopes_.emplace_back();
}

void state_buffer::merge_scope() {
  if (scopes_.size() < 2) {
    trustee::common::critical("merge_scope without an open scope");
  }
  auto top = std::move(scopes_.back());
  scopes_.pop_back();
  for (auto& [key, value] : top) {
    scopes_.back()[key] = std::move(value);
  }
}

void state_buffer::drop_scope() {
  if (scopes_.size() < 2) {
    trustee::common::critical("drop_scope without an open scope");
  }
  scopes_.pop_back();
}

std::size_t state_buffer::depth() const {
  return scopes_.size() - 1;
}

trustee::storage::write_set_t state_buffer::take_writes() {
  if (scopes_.size() != 1) {
    trustee::common::critical("take_writes while a write scope is open");
  }
  return std::exchange(scopes_.front(), trustee::storage::write_set_t{});
}

state_buffer::encoder_t& state_buffer::encoder() const {
  return encoder_;
}

write_scope::write_scope(state_buffer& state) : state_{state} {
  state_.push_scope();
}

write_scope::~write_scope() {
  if (!done_) {
    state_.drop_scope();
  }
}

void write_scope::commit() {
  if (done_) {
    return;
  }
  state_.merge_scope();
  done_ = true;
}

}  // namespace trustee::execution
