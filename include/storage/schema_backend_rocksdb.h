#pragma once

#include "storage/rocksdb_wrapper.h"
#include "storage/schema_storage_backend.h"

#include <memory>
#include <mutex>

namespace strata {

/// Schemas stored as "schema:<table>" keys in a RocksDB metadata store
class RocksDBSchemaBackend : public ISchemaStorageBackend {
public:
    static constexpr const char* kKeyPrefix = "schema:";

    /// @param db opened store; shared with other metadata users
    explicit RocksDBSchemaBackend(std::shared_ptr<RocksDBWrapper> db);

    std::optional<std::vector<uint8_t>> get(const std::string& table) override;
    void put(const std::string& table, const std::vector<uint8_t>& schema) override;
    bool remove(const std::string& table) override;
    bool exists(const std::string& table) override;
    std::string name() const override { return "rocksdb"; }

    /// Names of all tables with a stored schema
    std::vector<std::string> tables();

private:
    static std::string keyFor(const std::string& table);

    std::shared_ptr<RocksDBWrapper> db_;
    std::mutex mutex_;
};

} // namespace strata
