#include <tessera/common/critical.hpp>
#include <tessera/storage/rocksdb/storage.hpp>

namespace tessera::storage {

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
    tessera::common::critical("Failed to open ledger store at {}: {}", path,
                              status.ToString());
  }
  spdlog::info("Opened ledger store at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace tessera::storage
