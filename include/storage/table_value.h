#pragma once

#include "storage/slice.h"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace strata {

/// Packed row layout (all integers little-endian):
///
///   uint32 field_count
///   uint32 end_offset[field_count]   // end of field i, relative to data start
///   uint8  data[...]
///
/// Field i starts at end_offset[i-1] (0 for i == 0). Reading any field needs
/// two offsets, never a scan of the preceding fields.
namespace row_format {
constexpr size_t kCountSize = sizeof(uint32_t);
constexpr size_t kOffsetSize = sizeof(uint32_t);

inline size_t headerSize(size_t field_count) {
    return kCountSize + field_count * kOffsetSize;
}
} // namespace row_format

/// Read-only view over a materialized packed row.
///
/// Only the header is checked on construction. Field lengths are reported as
/// stored; a corrupted offset table can yield a negative length, which index
/// code must reject.
class TableValueReader {
public:
    TableValueReader() = default;

    /// @throws IndexCorruptionException if the header does not fit into size bytes
    TableValueReader(const uint8_t* ptr, size_t size);

    int count() const { return count_; }
    const uint8_t* pointer() const { return ptr_; }
    size_t size() const { return size_; }

    /// Address of field `index`, its length in `size`.
    /// @throws std::out_of_range if index is not in [0, count())
    /// @throws IndexCorruptionException if the field ends beyond the buffer
    const uint8_t* read(int index, int& size) const;

    /// Bounded slice over field `index`
    /// @throws IndexCorruptionException on negative or oversized length
    Slice readSlice(int index) const;

    int32_t readInt32(int index) const;
    int64_t readInt64(int index) const;
    bool readBool(int index) const;
    std::string_view readString(int index) const;

private:
    const uint8_t* fixedWidth(int index, int expected, const char* type_name) const;

    const uint8_t* ptr_ = nullptr;
    size_t size_ = 0;
    int count_ = 0;
    const uint8_t* data_ = nullptr;
    size_t data_size_ = 0;
};

/// Row under construction.
///
/// Offers the same read(index, size) contract as TableValueReader so key
/// derivation does not care whether the row is committed. Each field keeps
/// its own storage, so addresses returned by read() stay valid while the
/// builder lives (adding further fields does not move them).
class TableValueBuilder {
public:
    TableValueBuilder() = default;

    TableValueBuilder(TableValueBuilder&&) noexcept = default;
    TableValueBuilder& operator=(TableValueBuilder&&) noexcept = default;
    TableValueBuilder(const TableValueBuilder&) = delete;
    TableValueBuilder& operator=(const TableValueBuilder&) = delete;

    TableValueBuilder& add(int32_t value);
    TableValueBuilder& add(int64_t value);
    TableValueBuilder& add(bool value);
    TableValueBuilder& add(std::string_view value);
    TableValueBuilder& add(const char* value) { return add(std::string_view(value)); }
    TableValueBuilder& add(const uint8_t* ptr, size_t size);
    TableValueBuilder& add(const Slice& slice) { return add(slice.data(), slice.size()); }
    TableValueBuilder& add(const std::vector<uint8_t>& bytes) { return add(bytes.data(), bytes.size()); }

    /// 8-byte big-endian field, as consumed by fixed-size key indexes
    TableValueBuilder& addBigEndian(int64_t value);

    int count() const { return static_cast<int>(fields_.size()); }

    /// Packed size in bytes (header + data)
    size_t size() const;

    /// Length of field `index`
    /// @throws std::out_of_range if index is not in [0, count())
    int sizeOf(int index) const;

    /// @throws std::out_of_range if index is not in [0, count())
    const uint8_t* read(int index, int& size) const;

    /// Zero-copy slice over field `index` (valid while the builder lives)
    Slice sliceFromLocation(int index) const;

    /// Write the packed row to dest (must hold size() bytes)
    void copyTo(uint8_t* dest) const;

    std::vector<uint8_t> serialize() const;

    /// Reader over a buffer previously filled by copyTo()
    TableValueReader createReader(const uint8_t* ptr) const;

    void reset();

private:
    void checkIndex(int index) const;

    std::vector<std::vector<uint8_t>> fields_;
    size_t data_size_ = 0;
};

} // namespace strata
