#include "index/tree_index_def.h"
#include "index/field_range_index_def.h"
#include "index/dynamic_key_index_def.h"
#include "utils/logger.h"

#include <stdexcept>

namespace strata {

const char* treeIndexTypeToString(TreeIndexType type) {
    switch (type) {
        case TreeIndexType::DEFAULT: return "Default";
        case TreeIndexType::DYNAMIC_KEY_VALUES: return "DynamicKeyValues";
        default: return "Unknown";
    }
}

void AbstractTreeIndexDef::validateName() const {
    if (name_.empty()) {
        throw std::invalid_argument("Index name must be non-empty");
    }
}

std::vector<IndexMismatch> AbstractTreeIndexDef::differences(const AbstractTreeIndexDef& actual) const {
    std::vector<IndexMismatch> out;
    if (name_ != actual.name_) {
        out.push_back(mismatch("Name", name_, actual.name_));
    }
    if (is_global_ != actual.is_global_) {
        out.push_back(mismatch("IsGlobal", index_record::boolToString(is_global_),
                               index_record::boolToString(actual.is_global_)));
    }
    if (type() != actual.type()) {
        out.push_back(mismatch("Type", treeIndexTypeToString(type()), treeIndexTypeToString(actual.type())));
        return out;
    }
    collectDifferences(actual, out);
    return out;
}

void AbstractTreeIndexDef::ensureIdentical(const AbstractTreeIndexDef& actual) const {
    auto diffs = differences(actual);
    if (!diffs.empty()) {
        throw IndexDefinitionMismatchException(std::move(diffs.front()));
    }
}

// static
std::shared_ptr<AbstractTreeIndexDef> AbstractTreeIndexDef::readFrom(const TableValueReader& input) {
    index_record::requireFields(input, 1, "tree index");
    const int64_t tag = index_record::readInt64(input, 0, "Type");
    switch (static_cast<TreeIndexType>(tag)) {
        case TreeIndexType::DEFAULT:
            return FieldRangeIndexDef::readFrom(input);
        case TreeIndexType::DYNAMIC_KEY_VALUES:
            return DynamicKeyIndexDef::readFrom(input);
        default:
            break;
    }
    STRATA_ERROR("Unknown tree index type tag {} in persisted schema", tag);
    throw IndexCorruptionException("Unknown tree index type tag " + std::to_string(tag));
}

// static
std::shared_ptr<AbstractTreeIndexDef> AbstractTreeIndexDef::readFrom(const uint8_t* ptr, size_t size) {
    TableValueReader input(ptr, size);
    return readFrom(input);
}

namespace index_record {

void requireFields(const TableValueReader& input, int expected, std::string_view kind) {
    if (input.count() < expected) {
        throw IndexCorruptionException(std::string(kind) + " record has " + std::to_string(input.count()) +
                                       " fields, expected " + std::to_string(expected));
    }
}

namespace {
// Row readers throw IndexCorruptionException with a field number; prefix the logical name.
template<typename Fn>
auto named(std::string_view what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const IndexCorruptionException& e) {
        std::string_view detail(e.what());
        constexpr std::string_view kPrefix = "Index corruption: ";
        if (detail.starts_with(kPrefix)) {
            detail.remove_prefix(kPrefix.size());
        }
        throw IndexCorruptionException("while reading " + std::string(what) + ": " + std::string(detail));
    }
}
} // namespace

int32_t readInt32(const TableValueReader& input, int index, std::string_view what) {
    return named(what, [&] { return input.readInt32(index); });
}

int64_t readInt64(const TableValueReader& input, int index, std::string_view what) {
    return named(what, [&] { return input.readInt64(index); });
}

bool readBool(const TableValueReader& input, int index, std::string_view what) {
    return named(what, [&] { return input.readBool(index); });
}

std::string readString(const TableValueReader& input, int index, std::string_view what) {
    return named(what, [&] { return std::string(input.readString(index)); });
}

} // namespace index_record

} // namespace strata
