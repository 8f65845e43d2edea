#pragma once

#include "index/table_schema.h"

#include <optional>
#include <string>
#include <vector>

namespace strata {

/**
 * @brief Table schemas, storage and logging settings loaded from YAML
 *
 * Example:
 * @code
 * logging:    { level: info, file: strata.log }
 * validation: { report_all_mismatches: false }
 * storage:    { backend: filesystem, path: ./data/schemas }
 * tables:
 *   - name: documents
 *     primary_key: { start_index: 0 }
 *     indexes:
 *       - { name: by_collection, type: field_range, start_index: 1, count: 2 }
 *       - { name: by_lower_id, type: dynamic, scope: strata.builtin, generator: lowercase_first_field }
 *     fixed_size_indexes:
 *       - { name: etag, start_index: 3, global: true }
 * @endcode
 */
struct SchemaConfig {
    struct LoggingConfig {
        std::string level = "info";
        std::string file;               // empty: stderr only
        std::string pattern;            // empty: default pattern
    } logging;

    struct ValidationConfig {
        bool report_all_mismatches = false;
    } validation;

    struct StorageConfig {
        std::string backend = "filesystem";     // filesystem | rocksdb
        std::string path = "./data/schemas";
    } storage;

    struct PrimaryKeyConfig {
        std::string name;               // empty: "PK"
        int start_index = 0;
        bool global = false;
    };

    struct IndexConfig {
        std::string name;
        std::string type = "field_range";       // field_range | dynamic
        int start_index = 0;
        int count = 1;
        bool global = false;
        std::string scope;              // dynamic only
        std::string generator;          // dynamic only
    };

    struct FixedSizeIndexConfig {
        std::string name;
        int start_index = 0;
        bool global = false;
    };

    struct TableConfig {
        std::string name;
        std::optional<PrimaryKeyConfig> primary_key;
        std::vector<IndexConfig> indexes;
        std::vector<FixedSizeIndexConfig> fixed_size_indexes;
    };

    std::vector<TableConfig> tables;

    /// @throws std::runtime_error naming the file on unreadable or malformed YAML
    static SchemaConfig loadFromYaml(const std::string& yaml_path);
    static SchemaConfig loadFromString(const std::string& yaml_text);

    /// nullptr if the table is not configured
    const TableConfig* findTable(const std::string& name) const;

    /// Validated schema for a configured table; dynamic generators are
    /// resolved through KeyGeneratorRegistry::instance().
    /// @throws std::runtime_error naming the table on any failure
    TableSchema buildSchema(const std::string& table) const;
    static TableSchema buildSchema(const TableConfig& table);

    /// Initialize the logger from the logging section
    void applyLogging() const;
};

} // namespace strata
