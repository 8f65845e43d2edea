#include "storage/table_value.h"
#include "storage/schema_errors.h"
#include "utils/bits.h"

#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace strata {

using utils::bits::loadUInt32LE;
using utils::bits::storeUInt32LE;

// ===== TableValueReader =====

TableValueReader::TableValueReader(const uint8_t* ptr, size_t size) : ptr_(ptr), size_(size) {
    if (ptr_ == nullptr || size_ < row_format::kCountSize) {
        throw IndexCorruptionException("Row buffer of " + std::to_string(size_) +
                                       " bytes is too small for a row header");
    }
    const uint32_t count = loadUInt32LE(ptr_);
    if (count > static_cast<uint32_t>(std::numeric_limits<int>::max()) ||
        row_format::headerSize(count) > size_) {
        throw IndexCorruptionException("Row header declares " + std::to_string(count) +
                                       " fields but the buffer only has " + std::to_string(size_) + " bytes");
    }
    count_ = static_cast<int>(count);
    data_ = ptr_ + row_format::headerSize(count);
    data_size_ = size_ - row_format::headerSize(count);
}

const uint8_t* TableValueReader::read(int index, int& size) const {
    if (index < 0 || index >= count_) {
        throw std::out_of_range("Field index " + std::to_string(index) +
                                " is out of range for a row with " + std::to_string(count_) + " fields");
    }
    const uint8_t* offsets = ptr_ + row_format::kCountSize;
    const uint32_t end = loadUInt32LE(offsets + static_cast<size_t>(index) * row_format::kOffsetSize);
    const uint32_t start = index == 0
        ? 0u
        : loadUInt32LE(offsets + static_cast<size_t>(index - 1) * row_format::kOffsetSize);

    if (end > data_size_) {
        throw IndexCorruptionException("Field " + std::to_string(index) + " ends at " + std::to_string(end) +
                                       ", beyond the " + std::to_string(data_size_) + " data bytes of the row");
    }
    // Offsets are unsigned on disk; a decreasing pair surfaces as a negative length.
    size = static_cast<int>(static_cast<int64_t>(end) - static_cast<int64_t>(start));
    return data_ + (size < 0 ? end : start);
}

Slice TableValueReader::readSlice(int index) const {
    int size = 0;
    const uint8_t* ptr = read(index, size);
    if (size < 0) {
        throw IndexCorruptionException("Size cannot be negative (field " + std::to_string(index) + ")");
    }
    return Slice::external(ptr, static_cast<size_t>(size));
}

const uint8_t* TableValueReader::fixedWidth(int index, int expected, const char* type_name) const {
    int size = 0;
    const uint8_t* ptr = read(index, size);
    if (size != expected) {
        throw IndexCorruptionException(std::string("Field ") + std::to_string(index) + " should hold " +
                                       type_name + " (" + std::to_string(expected) + " bytes) but has " +
                                       std::to_string(size) + " bytes");
    }
    return ptr;
}

int32_t TableValueReader::readInt32(int index) const {
    return static_cast<int32_t>(loadUInt32LE(fixedWidth(index, 4, "int32")));
}

int64_t TableValueReader::readInt64(int index) const {
    return static_cast<int64_t>(utils::bits::loadUInt64LE(fixedWidth(index, 8, "int64")));
}

bool TableValueReader::readBool(int index) const {
    return *fixedWidth(index, 1, "bool") != 0;
}

std::string_view TableValueReader::readString(int index) const {
    int size = 0;
    const uint8_t* ptr = read(index, size);
    if (size < 0) {
        throw IndexCorruptionException("Size cannot be negative (field " + std::to_string(index) + ")");
    }
    return std::string_view(reinterpret_cast<const char*>(ptr), static_cast<size_t>(size));
}

// ===== TableValueBuilder =====

TableValueBuilder& TableValueBuilder::add(int32_t value) {
    uint8_t buf[4];
    storeUInt32LE(buf, static_cast<uint32_t>(value));
    return add(buf, sizeof(buf));
}

TableValueBuilder& TableValueBuilder::add(int64_t value) {
    uint8_t buf[8];
    utils::bits::storeUInt64LE(buf, static_cast<uint64_t>(value));
    return add(buf, sizeof(buf));
}

TableValueBuilder& TableValueBuilder::add(bool value) {
    uint8_t b = value ? 1 : 0;
    return add(&b, 1);
}

TableValueBuilder& TableValueBuilder::add(std::string_view value) {
    return add(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

TableValueBuilder& TableValueBuilder::add(const uint8_t* ptr, size_t size) {
    if (data_size_ + size > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("Row data would exceed 4 GiB");
    }
    fields_.emplace_back(ptr, ptr + size);
    data_size_ += size;
    return *this;
}

TableValueBuilder& TableValueBuilder::addBigEndian(int64_t value) {
    uint8_t buf[8];
    utils::bits::storeUInt64BE(buf, static_cast<uint64_t>(value));
    return add(buf, sizeof(buf));
}

size_t TableValueBuilder::size() const {
    return row_format::headerSize(fields_.size()) + data_size_;
}

void TableValueBuilder::checkIndex(int index) const {
    if (index < 0 || index >= count()) {
        throw std::out_of_range("Field index " + std::to_string(index) +
                                " is out of range for a row builder with " + std::to_string(count()) + " fields");
    }
}

int TableValueBuilder::sizeOf(int index) const {
    checkIndex(index);
    return static_cast<int>(fields_[static_cast<size_t>(index)].size());
}

const uint8_t* TableValueBuilder::read(int index, int& size) const {
    checkIndex(index);
    const auto& field = fields_[static_cast<size_t>(index)];
    size = static_cast<int>(field.size());
    return field.data();
}

Slice TableValueBuilder::sliceFromLocation(int index) const {
    int size = 0;
    const uint8_t* ptr = read(index, size);
    return Slice::external(ptr, static_cast<size_t>(size));
}

void TableValueBuilder::copyTo(uint8_t* dest) const {
    storeUInt32LE(dest, static_cast<uint32_t>(fields_.size()));
    uint8_t* offsets = dest + row_format::kCountSize;
    uint8_t* data = dest + row_format::headerSize(fields_.size());

    uint32_t end = 0;
    for (size_t i = 0; i < fields_.size(); ++i) {
        const auto& field = fields_[i];
        if (!field.empty()) {
            std::memcpy(data + end, field.data(), field.size());
        }
        end += static_cast<uint32_t>(field.size());
        storeUInt32LE(offsets + i * row_format::kOffsetSize, end);
    }
}

std::vector<uint8_t> TableValueBuilder::serialize() const {
    std::vector<uint8_t> out(size());
    copyTo(out.data());
    return out;
}

TableValueReader TableValueBuilder::createReader(const uint8_t* ptr) const {
    return TableValueReader(ptr, size());
}

void TableValueBuilder::reset() {
    fields_.clear();
    data_size_ = 0;
}

} // namespace strata
