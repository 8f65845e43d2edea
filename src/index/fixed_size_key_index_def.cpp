#include "index/fixed_size_key_index_def.h"
#include "index/tree_index_def.h"
#include "utils/bits.h"
#include "utils/logger.h"

#include <stdexcept>

namespace strata {

template<typename Row>
int64_t FixedSizeKeyIndexDef::extract(const Row& value) const {
    int size = 0;
    const uint8_t* ptr = value.read(start_index_, size);
    if (size != kKeySize) {
        throw IndexCorruptionException("Fixed size index " + name_ + " expects an 8 byte field at " +
                                       std::to_string(start_index_) + ", got " + std::to_string(size) + " bytes");
    }
    return decodeKey(ptr);
}

int64_t FixedSizeKeyIndexDef::getValue(const TableValueReader& value) const {
    return extract(value);
}

int64_t FixedSizeKeyIndexDef::getValue(const TableValueBuilder& value) const {
    return extract(value);
}

// static
std::array<uint8_t, FixedSizeKeyIndexDef::kKeySize> FixedSizeKeyIndexDef::encodeKey(int64_t value) {
    std::array<uint8_t, kKeySize> out{};
    utils::bits::storeUInt64BE(out.data(), static_cast<uint64_t>(value));
    return out;
}

// static
int64_t FixedSizeKeyIndexDef::decodeKey(const uint8_t* stored) {
    return static_cast<int64_t>(utils::bits::loadUInt64BE(stored));
}

std::vector<uint8_t> FixedSizeKeyIndexDef::serialize() const {
    TableValueBuilder serializer;
    serializer.add(static_cast<int32_t>(start_index_))
              .add(is_global_)
              .add(std::string_view(name_));
    return serializer.serialize();
}

// static
std::shared_ptr<FixedSizeKeyIndexDef> FixedSizeKeyIndexDef::readFrom(const uint8_t* location, size_t size) {
    TableValueReader input(location, size);
    return readFrom(input);
}

// static
std::shared_ptr<FixedSizeKeyIndexDef> FixedSizeKeyIndexDef::readFrom(const TableValueReader& input) {
    index_record::requireFields(input, 3, "Fixed size index");
    const int32_t start_index = index_record::readInt32(input, 0, "StartIndex");
    const bool is_global = index_record::readBool(input, 1, "IsGlobal");
    std::string name = index_record::readString(input, 2, "Name");

    STRATA_DEBUG("Read fixed size index '{}' (start={}, global={})", name, start_index, is_global);
    auto def = std::make_shared<FixedSizeKeyIndexDef>(std::move(name), start_index, is_global);
    index_record::requireValid(*def, "fixed size index");
    return def;
}

void FixedSizeKeyIndexDef::validate() const {
    if (name_.empty()) {
        throw std::invalid_argument("Index name must be non-empty");
    }
    if (start_index_ < 0) {
        throw std::out_of_range("StartIndex cannot be negative (index " + name_ + ")");
    }
}

std::vector<IndexMismatch> FixedSizeKeyIndexDef::differences(const FixedSizeKeyIndexDef& actual) const {
    std::vector<IndexMismatch> out;
    if (name_ != actual.name_) {
        out.push_back({name_, "Name", name_, actual.name_});
    }
    if (is_global_ != actual.is_global_) {
        out.push_back({name_, "IsGlobal", index_record::boolToString(is_global_),
                       index_record::boolToString(actual.is_global_)});
    }
    if (start_index_ != actual.start_index_) {
        out.push_back({name_, "StartIndex", std::to_string(start_index_), std::to_string(actual.start_index_)});
    }
    return out;
}

void FixedSizeKeyIndexDef::ensureIdentical(const FixedSizeKeyIndexDef& actual) const {
    auto diffs = differences(actual);
    if (!diffs.empty()) {
        throw IndexDefinitionMismatchException(std::move(diffs.front()));
    }
}

} // namespace strata
