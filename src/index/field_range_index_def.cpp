#include "index/field_range_index_def.h"
#include "utils/logger.h"

#include <cstring>
#include <stdexcept>

namespace strata {

// Both row forms expose read(index, size); the key is built the same way for
// committed and uncommitted rows.
template<typename Row>
ScopedSlice FieldRangeIndexDef::extract(utils::ByteArena& arena, const Row& value) const {
    if (count_ < 1 || start_index_ < 0) {
        throw std::out_of_range("Index " + name() + " has no fields to read (start " +
                                std::to_string(start_index_) + ", count " + std::to_string(count_) + ")");
    }
    int size = 0;
    const uint8_t* first = value.read(start_index_, size);
    if (size < 0) {
        throw IndexCorruptionException("Size cannot be negative (index " + name() +
                                       ", field " + std::to_string(start_index_) + ")");
    }

    if (count_ == 1) {
        return ScopedSlice::borrowed(Slice::external(first, static_cast<size_t>(size)));
    }

    int64_t total = size;
    for (int i = 1; i < count_; ++i) {
        int field_size = 0;
        value.read(start_index_ + i, field_size);
        if (field_size < 0) {
            throw IndexCorruptionException("Size cannot be negative (index " + name() +
                                           ", field " + std::to_string(start_index_ + i) + ")");
        }
        total += field_size;
    }
    if (total > static_cast<int64_t>(Slice::kMaxSize)) {
        throw IndexCorruptionException("Reading a slice that is too big to be a slice (index " + name() +
                                       ", " + std::to_string(total) + " bytes)");
    }

    utils::ArenaScope scope = arena.allocate(static_cast<size_t>(total));
    uint8_t* dest = scope.data();
    for (int i = 0; i < count_; ++i) {
        int field_size = 0;
        const uint8_t* src = value.read(start_index_ + i, field_size);
        if (field_size > 0) {
            std::memcpy(dest, src, static_cast<size_t>(field_size));
            dest += field_size;
        }
    }
    return ScopedSlice::owned(std::move(scope));
}

ScopedSlice FieldRangeIndexDef::getValue(utils::ByteArena& arena, const TableValueReader& value) const {
    return extract(arena, value);
}

ScopedSlice FieldRangeIndexDef::getValue(utils::ByteArena& arena, const TableValueBuilder& value) const {
    return extract(arena, value);
}

std::vector<uint8_t> FieldRangeIndexDef::serialize() const {
    TableValueBuilder serializer;
    serializer.add(static_cast<int64_t>(type()))
              .add(static_cast<int32_t>(start_index_))
              .add(static_cast<int32_t>(count_))
              .add(isGlobal())
              .add(std::string_view(name()));
    return serializer.serialize();
}

void FieldRangeIndexDef::validate() const {
    validateName();
    if (start_index_ < 0) {
        throw std::out_of_range("StartIndex cannot be negative (index " + name() + ")");
    }
    if (count_ < 1) {
        throw std::out_of_range("Count must be at least 1 (index " + name() + ")");
    }
}

// static
std::shared_ptr<FieldRangeIndexDef> FieldRangeIndexDef::readFrom(const TableValueReader& input) {
    index_record::requireFields(input, 5, "Field range index");
    const int32_t start_index = index_record::readInt32(input, 1, "StartIndex");
    const int32_t count = index_record::readInt32(input, 2, "Count");
    const bool is_global = index_record::readBool(input, 3, "IsGlobal");
    std::string name = index_record::readString(input, 4, "Name");

    STRATA_DEBUG("Read field range index '{}' (start={}, count={}, global={})", name, start_index, count, is_global);
    auto def = std::make_shared<FieldRangeIndexDef>(std::move(name), start_index, count, is_global);
    index_record::requireValid(*def, "field range index");
    return def;
}

void FieldRangeIndexDef::collectDifferences(const AbstractTreeIndexDef& actual, std::vector<IndexMismatch>& out) const {
    const auto& other = static_cast<const FieldRangeIndexDef&>(actual);
    if (start_index_ != other.start_index_) {
        out.push_back(mismatch("StartIndex", std::to_string(start_index_), std::to_string(other.start_index_)));
    }
    if (count_ != other.count_) {
        out.push_back(mismatch("Count", std::to_string(count_), std::to_string(other.count_)));
    }
}

} // namespace strata
