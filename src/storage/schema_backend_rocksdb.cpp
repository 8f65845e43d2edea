#include "storage/schema_backend_rocksdb.h"
#include "utils/logger.h"

#include <stdexcept>

namespace strata {

RocksDBSchemaBackend::RocksDBSchemaBackend(std::shared_ptr<RocksDBWrapper> db)
    : db_(std::move(db)) {
    if (!db_ || !db_->isOpen()) {
        throw std::invalid_argument("RocksDBSchemaBackend requires an open RocksDBWrapper");
    }
    STRATA_INFO("RocksDBSchemaBackend initialized: path={}", db_->getConfig().db_path);
}

std::string RocksDBSchemaBackend::keyFor(const std::string& table) {
    if (table.empty()) {
        throw std::invalid_argument("Table name must be non-empty");
    }
    return std::string(kKeyPrefix) + table;
}

std::optional<std::vector<uint8_t>> RocksDBSchemaBackend::get(const std::string& table) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_->get(keyFor(table));
}

void RocksDBSchemaBackend::put(const std::string& table, const std::vector<uint8_t>& schema) {
    std::lock_guard<std::mutex> lock(mutex_);
    db_->put(keyFor(table), schema);
    STRATA_DEBUG("RocksDBSchemaBackend: stored schema of {} ({} bytes)", table, schema.size());
}

bool RocksDBSchemaBackend::remove(const std::string& table) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_->del(keyFor(table));
}

bool RocksDBSchemaBackend::exists(const std::string& table) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_->get(keyFor(table)).has_value();
}

std::vector<std::string> RocksDBSchemaBackend::tables() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    const std::string prefix(kKeyPrefix);
    db_->scanPrefix(prefix, [&out, &prefix](std::string_view key, std::string_view) {
        out.emplace_back(key.substr(prefix.size()));
        return true;
    });
    return out;
}

} // namespace strata
