#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <stategen/common/critical.hpp>
#include <stategen/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace stategen::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const stategen::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline stategen::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline stategen::schema::state_error make_store_error(
    const std::string_view operation,
    const ROCKSDB_NAMESPACE::Status& status) {
  spdlog::error("RocksDB {} failed: {}", operation, status.ToString());
  return stategen::schema::make_state_error(
      stategen::schema::state_error_code::store_io, 0,
      stategen::schema::make_zero_hash(),
      std::string{operation} + ": " + status.ToString());
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  common::result<std::optional<T>> get(
      Encoder& encoder,
      const stategen::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  common::result<void> put(Encoder& encoder,
                           const stategen::schema::bytes_view_t& key,
                           const T& value) const;

  common::result<bool> contains(
      const stategen::schema::bytes_view_t& key) const;
  common::result<std::vector<key_value_entry_t>> list_by_prefix(
      const stategen::schema::bytes_view_t& prefix) const;
  common::result<std::optional<key_value_entry_t>> last_by_prefix(
      const stategen::schema::bytes_view_t& prefix,
      const stategen::schema::bytes_view_t& upper_bound) const;
  common::result<void> write(const write_batch_t& batch) const;

 private:
  ROCKSDB_NAMESPACE::DB& db() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
common::result<std::optional<T>> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const stategen::schema::bytes_view_t& key) const {
  auto value = std::string{};
  auto status =
      db().Get(ROCKSDB_NAMESPACE::ReadOptions{}, detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::optional<T>{};
  }
  if (!status.ok()) {
    return detail::make_store_error("get", status);
  }
  auto decoded =
      encoder.template try_decode<T>(stategen::schema::bytes_view_t{
          reinterpret_cast<const uint8_t*>(value.data()), value.size()});
  if (!decoded) {
    spdlog::error("Failed to decode value stored at key of {} bytes",
                  key.size());
    return stategen::schema::make_state_error(
        stategen::schema::state_error_code::store_io, 0,
        stategen::schema::make_zero_hash(), "undecodable value in store");
  }
  return decoded;
}

template <typename T, typename Encoder>
common::result<void> storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const stategen::schema::bytes_view_t& key,
    const T& value) const {
  auto encoded_value = encoder.encode(value);
  auto status = db().Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(stategen::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    return detail::make_store_error("put", status);
  }
  return common::success();
}

}  // namespace stategen::storage
