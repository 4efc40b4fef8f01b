#include <stategen/common/critical.hpp>
#include <stategen/storage/rocksdb/storage.hpp>

namespace stategen::storage {

namespace {

bool starts_with(const ROCKSDB_NAMESPACE::Slice& key,
                 const stategen::schema::bytes_view_t& prefix) {
  return key.starts_with(detail::to_slice(prefix));
}

}  // namespace

ROCKSDB_NAMESPACE::DB& storage<rocksdb_storage_tag>::db() const {
  if (!database) {
    stategen::common::critical("RocksDB database is not initialized");
  }
  return *database;
}

common::result<bool> storage<rocksdb_storage_tag>::contains(
    const stategen::schema::bytes_view_t& key) const {
  auto value = std::string{};
  auto status =
      db().Get(ROCKSDB_NAMESPACE::ReadOptions{}, detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    return detail::make_store_error("contains", status);
  }
  return true;
}

common::result<std::vector<key_value_entry_t>>
storage<rocksdb_storage_tag>::list_by_prefix(
    const stategen::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      db().NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(detail::to_slice(prefix));
       iterator->Valid() && starts_with(iterator->key(), prefix);
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    return detail::make_store_error("prefix scan", iterator->status());
  }
  return entries;
}

common::result<std::optional<key_value_entry_t>>
storage<rocksdb_storage_tag>::last_by_prefix(
    const stategen::schema::bytes_view_t& prefix,
    const stategen::schema::bytes_view_t& upper_bound) const {
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      db().NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->SeekForPrev(detail::to_slice(upper_bound));
  if (!iterator->status().ok()) {
    return detail::make_store_error("reverse seek", iterator->status());
  }
  if (!iterator->Valid() || !starts_with(iterator->key(), prefix)) {
    return std::optional<key_value_entry_t>{};
  }
  return std::optional<key_value_entry_t>{key_value_entry_t{
      detail::to_bytes(iterator->key()), detail::to_bytes(iterator->value())}};
}

common::result<void> storage<rocksdb_storage_tag>::write(
    const write_batch_t& batch) const {
  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& entry : batch) {
    auto key = detail::to_slice(stategen::schema::make_bytes_view(entry.key));
    auto status =
        entry.value
            ? rocks_batch.Put(key, detail::to_slice(
                                       stategen::schema::make_bytes_view(
                                           *entry.value)))
            : rocks_batch.Delete(key);
    if (!status.ok()) {
      return detail::make_store_error("batch staging", status);
    }
  }
  auto status = db().Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocks_batch);
  if (!status.ok()) {
    return detail::make_store_error("batch write", status);
  }
  return common::success();
}

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
    stategen::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace stategen::storage
