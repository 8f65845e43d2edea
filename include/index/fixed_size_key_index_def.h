#pragma once

#include "storage/schema_errors.h"
#include "storage/table_value.h"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace strata {

/// Index keyed by one 64-bit integer, stored in the fixed-size-key tree.
///
/// The row field holds the integer big-endian (8 bytes); the fixed-size tree
/// orders keys by raw bytes, which then matches numeric order for
/// non-negative values. Persisted without a kind tag: the schema keeps these
/// in their own section.
class FixedSizeKeyIndexDef {
public:
    static constexpr int kKeySize = sizeof(int64_t);

    FixedSizeKeyIndexDef(std::string name, int start_index, bool is_global = false)
        : name_(std::move(name)), start_index_(start_index), is_global_(is_global) {}

    const std::string& name() const { return name_; }
    int startIndex() const { return start_index_; }
    bool isGlobal() const { return is_global_; }

    /// @throws IndexCorruptionException if the field is not exactly 8 bytes
    int64_t getValue(const TableValueReader& value) const;
    int64_t getValue(const TableValueBuilder& value) const;

    /// Stored byte layout of a key
    static std::array<uint8_t, kKeySize> encodeKey(int64_t value);
    static int64_t decodeKey(const uint8_t* stored);

    /// start_index(i32), is_global(bool), name
    std::vector<uint8_t> serialize() const;

    static std::shared_ptr<FixedSizeKeyIndexDef> readFrom(const uint8_t* location, size_t size);
    static std::shared_ptr<FixedSizeKeyIndexDef> readFrom(const TableValueReader& input);

    /// @throws std::invalid_argument / std::out_of_range
    void validate() const;

    /// @throws IndexDefinitionMismatchException naming the first differing field
    void ensureIdentical(const FixedSizeKeyIndexDef& actual) const;
    std::vector<IndexMismatch> differences(const FixedSizeKeyIndexDef& actual) const;

private:
    template<typename Row>
    int64_t extract(const Row& value) const;

    std::string name_;
    int start_index_;
    bool is_global_;
};

using FixedSizeKeyIndexDefPtr = std::shared_ptr<const FixedSizeKeyIndexDef>;

} // namespace strata
