#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rocksdb {
    class DB;
    class Options;
    class ReadOptions;
    class WriteOptions;
}

namespace strata {

/// Thin wrapper around a plain RocksDB instance holding engine metadata
/// (persisted table schemas). Not used for row data.
class RocksDBWrapper {
public:
    struct Config {
        std::string db_path = "./data/metadata";
        bool create_if_missing = true;
        bool sync_writes = true;
        size_t block_cache_size_mb = 8;
        // "none", "lz4", "zstd", "snappy"
        std::string compression = "none";
    };

    explicit RocksDBWrapper(const Config& config);
    ~RocksDBWrapper();

    RocksDBWrapper(const RocksDBWrapper&) = delete;
    RocksDBWrapper& operator=(const RocksDBWrapper&) = delete;

    /// Open the database; false (and logged) on failure
    bool open();
    void close();
    bool isOpen() const;

    /// nullopt if the key does not exist
    /// @throws std::runtime_error on read errors or if the database is closed
    std::optional<std::vector<uint8_t>> get(std::string_view key);

    /// @throws std::runtime_error on write errors or if the database is closed
    void put(std::string_view key, const std::vector<uint8_t>& value);

    /// @return false if the key did not exist
    bool del(std::string_view key);

    /// Visit keys starting with prefix in order; stop when callback returns false
    using ScanCallback = std::function<bool(std::string_view key, std::string_view value)>;
    void scanPrefix(std::string_view prefix, const ScanCallback& callback);

    const Config& getConfig() const { return config_; }

private:
    void configureOptions();
    rocksdb::DB& db() const;

    Config config_;
    std::unique_ptr<rocksdb::DB> db_;
    std::unique_ptr<rocksdb::Options> options_;
    std::unique_ptr<rocksdb::ReadOptions> read_options_;
    std::unique_ptr<rocksdb::WriteOptions> write_options_;
};

} // namespace strata
