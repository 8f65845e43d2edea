#include "storage/rocksdb_wrapper.h"
#include "utils/logger.h"

#include <rocksdb/cache.h>
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/table.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace strata {

RocksDBWrapper::RocksDBWrapper(const Config& config) : config_(config) {
    options_ = std::make_unique<rocksdb::Options>();
    read_options_ = std::make_unique<rocksdb::ReadOptions>();
    write_options_ = std::make_unique<rocksdb::WriteOptions>();
    configureOptions();
}

RocksDBWrapper::~RocksDBWrapper() {
    close();
}

void RocksDBWrapper::configureOptions() {
    options_->create_if_missing = config_.create_if_missing;

    rocksdb::BlockBasedTableOptions table_options;
    table_options.block_cache = rocksdb::NewLRUCache(config_.block_cache_size_mb * 1024 * 1024);
    options_->table_factory.reset(rocksdb::NewBlockBasedTableFactory(table_options));

    auto toCompression = [](std::string v) {
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return std::tolower(c); });
        if (v == "lz4") return rocksdb::kLZ4Compression;
        if (v == "zstd") return rocksdb::kZSTD;
        if (v == "snappy") return rocksdb::kSnappyCompression;
        return rocksdb::kNoCompression;
    };
    options_->compression = toCompression(config_.compression);

    write_options_->sync = config_.sync_writes;
}

bool RocksDBWrapper::open() {
    std::error_code ec;
    std::filesystem::create_directories(config_.db_path, ec);
    if (ec) {
        STRATA_ERROR("Failed to create metadata directory '{}': {}", config_.db_path, ec.message());
        return false;
    }

    rocksdb::DB* raw = nullptr;
    rocksdb::Status status = rocksdb::DB::Open(*options_, config_.db_path, &raw);
    if (!status.ok()) {
        STRATA_ERROR("Failed to open RocksDB at {}: {}", config_.db_path, status.ToString());
        return false;
    }
    db_.reset(raw);
    STRATA_INFO("Opened RocksDB metadata store at: {}", config_.db_path);
    return true;
}

void RocksDBWrapper::close() {
    if (db_) {
        STRATA_INFO("Closing RocksDB metadata store");
        db_.reset();
    }
}

bool RocksDBWrapper::isOpen() const {
    return db_ != nullptr;
}

rocksdb::DB& RocksDBWrapper::db() const {
    if (!db_) {
        throw std::runtime_error("RocksDB metadata store is not open");
    }
    return *db_;
}

std::optional<std::vector<uint8_t>> RocksDBWrapper::get(std::string_view key) {
    std::string value;
    rocksdb::Status status = db().Get(*read_options_, rocksdb::Slice(key.data(), key.size()), &value);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    if (!status.ok()) {
        throw std::runtime_error("RocksDB get failed: " + status.ToString());
    }
    return std::vector<uint8_t>(value.begin(), value.end());
}

void RocksDBWrapper::put(std::string_view key, const std::vector<uint8_t>& value) {
    rocksdb::Status status = db().Put(
        *write_options_,
        rocksdb::Slice(key.data(), key.size()),
        rocksdb::Slice(reinterpret_cast<const char*>(value.data()), value.size()));
    if (!status.ok()) {
        throw std::runtime_error("RocksDB put failed: " + status.ToString());
    }
}

bool RocksDBWrapper::del(std::string_view key) {
    if (!get(key)) {
        return false;
    }
    rocksdb::Status status = db().Delete(*write_options_, rocksdb::Slice(key.data(), key.size()));
    if (!status.ok()) {
        throw std::runtime_error("RocksDB delete failed: " + status.ToString());
    }
    return true;
}

void RocksDBWrapper::scanPrefix(std::string_view prefix, const ScanCallback& callback) {
    std::unique_ptr<rocksdb::Iterator> it(db().NewIterator(*read_options_));
    const rocksdb::Slice start(prefix.data(), prefix.size());
    for (it->Seek(start); it->Valid() && it->key().starts_with(start); it->Next()) {
        const auto k = it->key();
        const auto v = it->value();
        if (!callback(std::string_view(k.data(), k.size()), std::string_view(v.data(), v.size()))) {
            break;
        }
    }
    if (!it->status().ok()) {
        throw std::runtime_error("RocksDB scan failed: " + it->status().ToString());
    }
}

} // namespace strata
