#include "storage/schema_catalog.h"
#include "utils/logger.h"

#include <stdexcept>

namespace strata {

SchemaCatalog::SchemaCatalog(std::shared_ptr<ISchemaStorageBackend> backend, bool report_all_mismatches)
    : backend_(std::move(backend))
    , report_all_mismatches_(report_all_mismatches) {
    if (!backend_) {
        throw std::invalid_argument("SchemaCatalog requires a storage backend");
    }
}

TableSchema SchemaCatalog::openTable(const std::string& table, const TableSchema& expected) {
    expected.validate();

    std::lock_guard<std::mutex> lock(open_mutex_);
    auto stored = backend_->get(table);
    if (!stored) {
        backend_->put(table, expected.serialize());
        STRATA_INFO("Created schema for table '{}' on {} backend", table, backend_->name());
        return expected;
    }

    TableSchema persisted = TableSchema::readFrom(*stored);
    try {
        expected.ensureIdentical(persisted, report_all_mismatches_);
    } catch (const SchemaDriftException& e) {
        STRATA_ERROR("Table '{}' cannot be opened: {}", table, e.what());
        throw;
    }

    persisted.adoptEntryChangedCallbacks(expected);
    STRATA_INFO("Opened table '{}' ({} indexes, {} fixed size indexes)", table,
                persisted.indexCount(), persisted.fixedSizeIndexCount());
    return persisted;
}

void SchemaCatalog::save(const std::string& table, const TableSchema& schema) {
    schema.validate();
    backend_->put(table, schema.serialize());
    STRATA_INFO("Saved schema for table '{}'", table);
}

std::optional<TableSchema> SchemaCatalog::load(const std::string& table) const {
    auto stored = backend_->get(table);
    if (!stored) {
        return std::nullopt;
    }
    return TableSchema::readFrom(*stored);
}

bool SchemaCatalog::drop(const std::string& table) {
    return backend_->remove(table);
}

} // namespace strata
