#pragma once

#include "index/field_range_index_def.h"
#include "index/fixed_size_key_index_def.h"
#include "index/tree_index_def.h"
#include "storage/schema_errors.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace strata {

/// TableSchema
/// - Primary key (field range, single field) plus secondary and fixed-size indexes
/// - Index names are unique across all three groups
/// - Persisted as one packed row; on table open the persisted copy is compared
///   field by field against the schema declared in code
///
/// Build it once, validate it, then share it read-only.
class TableSchema {
public:
    static constexpr const char* kDefaultPrimaryKeyName = "PK";

    TableSchema() = default;

    /// Define the primary key. An empty name becomes "PK"; a global primary
    /// key must be named explicitly.
    /// @throws std::invalid_argument if the key spans more than one field
    TableSchema& defineKey(std::shared_ptr<FieldRangeIndexDef> key);

    /// @throws std::invalid_argument on invalid definition or duplicate name
    TableSchema& defineIndex(std::shared_ptr<AbstractTreeIndexDef> index);
    TableSchema& defineFixedSizeIndex(std::shared_ptr<FixedSizeKeyIndexDef> index);

    std::shared_ptr<const FieldRangeIndexDef> key() const { return primary_key_; }

    /// Secondary indexes in definition order
    std::vector<TreeIndexDefPtr> indexes() const;
    std::vector<FixedSizeKeyIndexDefPtr> fixedSizeIndexes() const;

    /// nullptr if there is no such index
    TreeIndexDefPtr index(const std::string& name) const;
    FixedSizeKeyIndexDefPtr fixedSizeIndex(const std::string& name) const;

    size_t indexCount() const { return indexes_.size(); }
    size_t fixedSizeIndexCount() const { return fixed_size_indexes_.size(); }

    /// Validate every definition and the uniqueness of names
    void validate() const;

    /// primary key record (empty if none), index count(i32), index records...,
    /// fixed-size count(i32), fixed-size records...
    std::vector<uint8_t> serialize() const;

    /// @throws IndexCorruptionException on malformed bytes
    /// @throws KeyGeneratorResolutionException if a dynamic index cannot be bound
    static TableSchema readFrom(const uint8_t* ptr, size_t size);
    static TableSchema readFrom(const std::vector<uint8_t>& bytes) { return readFrom(bytes.data(), bytes.size()); }

    /// Every difference between this (expected) schema and `actual`
    std::vector<SchemaMismatch> diff(const TableSchema& actual) const;

    /// @throws SchemaDriftException with the first (or, with report_all, every) mismatch
    void ensureIdentical(const TableSchema& actual, bool report_all = false) const;

    /// Attach entry-changed callbacks of `source`'s dynamic indexes to the
    /// same-named dynamic indexes of this schema. Required after readFrom(),
    /// which cannot restore callbacks. Returns the number attached.
    size_t adoptEntryChangedCallbacks(const TableSchema& source);

    /// Human-readable listing for logs and tools
    std::string describe() const;

private:
    bool hasName(const std::string& name) const;
    void insertIndex(std::shared_ptr<AbstractTreeIndexDef> index);
    void insertFixedSizeIndex(std::shared_ptr<FixedSizeKeyIndexDef> index);

    std::shared_ptr<FieldRangeIndexDef> primary_key_;
    std::vector<std::shared_ptr<AbstractTreeIndexDef>> indexes_;
    std::vector<std::shared_ptr<FixedSizeKeyIndexDef>> fixed_size_indexes_;
    std::map<std::string, size_t> index_by_name_;
    std::map<std::string, size_t> fixed_size_by_name_;
};

} // namespace strata
