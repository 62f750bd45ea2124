#include <strongbox/common/critical.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>

namespace strongbox::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  if (path.empty()) {
    strongbox::common::critical("ledger database path is empty");
  }

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  // Ledger rows are small and few; a corrupt row must stop the vault.
  options.paranoid_checks = true;
  options.OptimizeForSmallDb();

  auto* database = static_cast<ROCKSDB_NAMESPACE::DB*>(nullptr);
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Cannot open ledger database at {}: {}", path,
                  status.ToString());
    strongbox::common::critical("failed to open ledger database");
  }
  spdlog::debug("Opened ledger database at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  return store;
}

}  // namespace strongbox::storage
