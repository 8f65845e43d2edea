#pragma once

#include "index/tree_index_def.h"

namespace strata {

/// Index over `count` consecutive fields starting at `start_index`.
///
/// Single-field keys are zero-copy slices into the row. Multi-field keys are
/// concatenated into one arena allocation of exactly the combined length.
class FieldRangeIndexDef : public AbstractTreeIndexDef {
public:
    FieldRangeIndexDef(std::string name, int start_index, int count = 1, bool is_global = false)
        : AbstractTreeIndexDef(std::move(name), is_global)
        , start_index_(start_index)
        , count_(count) {}

    TreeIndexType type() const override { return TreeIndexType::DEFAULT; }

    int startIndex() const { return start_index_; }
    int count() const { return count_; }

    ScopedSlice getValue(utils::ByteArena& arena, const TableValueReader& value) const override;
    ScopedSlice getValue(utils::ByteArena& arena, const TableValueBuilder& value) const override;

    /// type(i64), start_index(i32), count(i32), is_global(bool), name
    std::vector<uint8_t> serialize() const override;

    void validate() const override;

    static std::shared_ptr<FieldRangeIndexDef> readFrom(const TableValueReader& input);

    /// Copy with a different name; used when the primary key gets its default name
    std::shared_ptr<FieldRangeIndexDef> withName(std::string name) const {
        return std::make_shared<FieldRangeIndexDef>(std::move(name), start_index_, count_, isGlobal());
    }

protected:
    void collectDifferences(const AbstractTreeIndexDef& actual, std::vector<IndexMismatch>& out) const override;

private:
    template<typename Row>
    ScopedSlice extract(utils::ByteArena& arena, const Row& value) const;

    int start_index_;
    int count_;
};

} // namespace strata
