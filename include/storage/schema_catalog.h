#pragma once

#include "index/table_schema.h"
#include "storage/schema_storage_backend.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace strata {

/**
 * @brief Opens tables against their persisted schemas
 *
 * On first open the schema declared in code is validated and persisted. On
 * every later open the persisted copy is read back, compared with the
 * declared one and, if identical, returned with the declared schema's
 * entry-changed callbacks attached.
 */
class SchemaCatalog {
public:
    explicit SchemaCatalog(std::shared_ptr<ISchemaStorageBackend> backend, bool report_all_mismatches = false);

    /**
     * @throws SchemaDriftException if the persisted schema differs from `expected`
     * @throws IndexCorruptionException / KeyGeneratorResolutionException if it cannot be read
     */
    TableSchema openTable(const std::string& table, const TableSchema& expected);

    /// Validate and persist, replacing whatever is stored
    void save(const std::string& table, const TableSchema& schema);

    /// nullopt if the table has no persisted schema
    std::optional<TableSchema> load(const std::string& table) const;

    bool drop(const std::string& table);

    ISchemaStorageBackend& backend() const { return *backend_; }
    bool reportAllMismatches() const { return report_all_mismatches_; }

private:
    std::shared_ptr<ISchemaStorageBackend> backend_;
    bool report_all_mismatches_;
    std::mutex open_mutex_;     // serializes check-then-persist in openTable
};

} // namespace strata
