#pragma once
#include <stategen/common/result.hpp>
#include <stategen/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace stategen::storage {

using key_value_entry_t =
    std::pair<stategen::schema::bytes_t, stategen::schema::bytes_t>;

/// One mutation of an atomic write; an empty value deletes the key.
struct batch_entry final {
  stategen::schema::bytes_t key;
  std::optional<stategen::schema::bytes_t> value;
};

using write_batch_t = std::vector<batch_entry>;

/// Key-value contract consumed by the state generation service. Every call
/// that touches the backend reports failures as `store_io`.
template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  common::result<std::optional<T>> get(
      Encoder& encoder,
      const stategen::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  common::result<void> put(Encoder& encoder,
                           const stategen::schema::bytes_view_t& key,
                           const T& value) const;

  /// True when the key is present.
  common::result<bool> contains(
      const stategen::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  common::result<std::vector<key_value_entry_t>> list_by_prefix(
      const stategen::schema::bytes_view_t& prefix) const;

  /// Return the greatest entry under `prefix` whose key is <= `upper_bound`.
  common::result<std::optional<key_value_entry_t>> last_by_prefix(
      const stategen::schema::bytes_view_t& prefix,
      const stategen::schema::bytes_view_t& upper_bound) const;

  /// Apply all puts and deletes atomically.
  common::result<void> write(const write_batch_t& batch) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace stategen::storage
