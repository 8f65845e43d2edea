#pragma once

#include "storage/schema_errors.h"
#include "storage/slice.h"
#include "storage/table_value.h"
#include "utils/byte_arena.h"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

/// Kind tag of variable-length-key indexes.
/// Persisted as int64 so new kinds can be added without changing the format.
enum class TreeIndexType : int64_t {
    DEFAULT = 0x01,             // contiguous field range
    DYNAMIC_KEY_VALUES = 0x02   // registered key generator
};

const char* treeIndexTypeToString(TreeIndexType type);

/// Common part of every index stored in a variable-length-key tree.
///
/// Definitions are immutable once constructed and may be shared by any
/// number of concurrent row operations.
class AbstractTreeIndexDef {
public:
    virtual ~AbstractTreeIndexDef() = default;

    virtual TreeIndexType type() const = 0;

    const std::string& name() const { return name_; }
    bool isGlobal() const { return is_global_; }

    /// Key of this index for a materialized row
    virtual ScopedSlice getValue(utils::ByteArena& arena, const TableValueReader& value) const = 0;

    /// Key of this index for a row that is still being built
    virtual ScopedSlice getValue(utils::ByteArena& arena, const TableValueBuilder& value) const = 0;

    /// Packed-row encoding, starting with the kind tag
    virtual std::vector<uint8_t> serialize() const = 0;

    /// Self-validation
    /// @throws std::invalid_argument / std::out_of_range on an ill-formed definition
    virtual void validate() const = 0;

    /// Structural comparison against the definition found on disk.
    /// @throws IndexDefinitionMismatchException naming the first differing field
    void ensureIdentical(const AbstractTreeIndexDef& actual) const;

    /// Every differing field, in the order ensureIdentical() checks them
    std::vector<IndexMismatch> differences(const AbstractTreeIndexDef& actual) const;

    /// Deserialize a record produced by serialize(), dispatching on the kind tag
    /// @throws IndexCorruptionException on an unknown tag or malformed record
    static std::shared_ptr<AbstractTreeIndexDef> readFrom(const TableValueReader& input);
    static std::shared_ptr<AbstractTreeIndexDef> readFrom(const uint8_t* ptr, size_t size);

protected:
    AbstractTreeIndexDef(std::string name, bool is_global)
        : name_(std::move(name)), is_global_(is_global) {}

    /// Kind-specific fields; only called when both sides have the same type()
    virtual void collectDifferences(const AbstractTreeIndexDef& actual,
                                    std::vector<IndexMismatch>& out) const = 0;

    /// @throws std::invalid_argument if the name is empty
    void validateName() const;

    IndexMismatch mismatch(std::string field, std::string expected, std::string actual) const {
        return IndexMismatch{name_, std::move(field), std::move(expected), std::move(actual)};
    }

private:
    std::string name_;
    bool is_global_;
};

using TreeIndexDefPtr = std::shared_ptr<const AbstractTreeIndexDef>;

/// Helpers shared by the record readers
namespace index_record {

/// Reads an int32/int64/bool field, rejecting wrong widths as corruption
int32_t readInt32(const TableValueReader& input, int index, std::string_view what);
int64_t readInt64(const TableValueReader& input, int index, std::string_view what);
bool readBool(const TableValueReader& input, int index, std::string_view what);
std::string readString(const TableValueReader& input, int index, std::string_view what);

/// Rejects records with fewer fields than the kind requires
void requireFields(const TableValueReader& input, int expected, std::string_view kind);

/// Runs def.validate() on a definition rebuilt from persisted bytes; an
/// ill-formed definition there is corruption, not a caller error.
template<typename Def>
void requireValid(const Def& def, std::string_view kind) {
    try {
        def.validate();
    } catch (const std::logic_error& e) {
        throw IndexCorruptionException("Persisted " + std::string(kind) + " is invalid: " + e.what());
    }
}

inline const char* boolToString(bool value) { return value ? "true" : "false"; }

} // namespace index_record

} // namespace strata
