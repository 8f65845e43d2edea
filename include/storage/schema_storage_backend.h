#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace strata {

/**
 * @brief Persistent store for serialized table schemas
 *
 * Keyed by table name. Values are the bytes produced by
 * TableSchema::serialize().
 *
 * Thread-Safety: Implementations must be thread-safe.
 */
class ISchemaStorageBackend {
public:
    virtual ~ISchemaStorageBackend() = default;

    /**
     * @brief Read the persisted schema of a table
     * @return Schema bytes or nullopt if none is stored
     * @throws std::runtime_error on I/O failure
     */
    virtual std::optional<std::vector<uint8_t>> get(const std::string& table) = 0;

    /**
     * @brief Store (or replace) the schema of a table
     * @throws std::runtime_error on failure
     */
    virtual void put(const std::string& table, const std::vector<uint8_t>& schema) = 0;

    /// @return true if deleted, false if not found
    virtual bool remove(const std::string& table) = 0;

    virtual bool exists(const std::string& table) = 0;

    /// Backend name ("filesystem", "rocksdb")
    virtual std::string name() const = 0;
};

/**
 * @brief One file per table: base_path/<table>.schema
 *
 * Writes go to a temporary file that is renamed over the target, so a
 * crash never leaves a half-written schema behind.
 */
class FilesystemSchemaBackend : public ISchemaStorageBackend {
public:
    /// Creates base_path if missing
    explicit FilesystemSchemaBackend(std::string base_path);

    std::optional<std::vector<uint8_t>> get(const std::string& table) override;
    void put(const std::string& table, const std::vector<uint8_t>& schema) override;
    bool remove(const std::string& table) override;
    bool exists(const std::string& table) override;
    std::string name() const override { return "filesystem"; }

    const std::string& basePath() const { return base_path_; }

private:
    /// @throws std::invalid_argument on names that are not plain file names
    std::string pathFor(const std::string& table) const;

    std::string base_path_;
};

} // namespace strata
