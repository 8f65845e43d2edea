#pragma once

#include "utils/byte_arena.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace strata {

/// Bounded, non-owning view over key bytes.
/// A slice never exceeds kMaxSize bytes; constructing a longer one is a
/// bounds error, never a silent truncation.
class Slice {
public:
    static constexpr size_t kMaxSize = 0xFFFF;

    Slice() = default;

    /// View over memory owned by someone else (row, builder, arena scope).
    /// @throws IndexCorruptionException if size > kMaxSize
    static Slice external(const uint8_t* data, size_t size);

    /// View over a string literal or std::string (test and config helpers)
    static Slice fromString(std::string_view str);

    const uint8_t* data() const { return data_; }
    uint16_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    std::string_view view() const {
        return std::string_view(reinterpret_cast<const char*>(data_), size_);
    }
    std::string toString() const { return std::string(view()); }

    /// Copy content to dest (must hold size() bytes)
    void copyTo(uint8_t* dest) const;

    /// Byte equality, independent of address
    bool equals(const Slice& other) const;
    /// Unsigned lexicographic comparison (<0, 0, >0)
    int compare(const Slice& other) const;

private:
    Slice(const uint8_t* data, uint16_t size) : data_(data), size_(size) {}

    const uint8_t* data_ = nullptr;
    uint16_t size_ = 0;
};

/// A key slice together with the arena allocation backing it, if any.
///
/// Borrowed slices point into a row or builder and are valid for that
/// object's lifetime. Owned slices keep their ArenaScope alive and release it
/// when the ScopedSlice is destroyed.
class ScopedSlice {
public:
    ScopedSlice() = default;

    static ScopedSlice borrowed(Slice slice) {
        ScopedSlice s;
        s.slice_ = slice;
        return s;
    }

    /// Slice covering the whole allocation
    static ScopedSlice owned(utils::ArenaScope scope);

    ScopedSlice(ScopedSlice&& other) noexcept;
    ScopedSlice& operator=(ScopedSlice&& other) noexcept;
    ScopedSlice(const ScopedSlice&) = delete;
    ScopedSlice& operator=(const ScopedSlice&) = delete;

    const Slice& slice() const { return slice_; }
    const uint8_t* data() const { return slice_.data(); }
    uint16_t size() const { return slice_.size(); }
    std::string_view view() const { return slice_.view(); }
    std::string toString() const { return slice_.toString(); }

    bool isOwned() const { return scope_.valid(); }

    /// True if the slice points somewhere inside [begin, begin + length)
    bool pointsInto(const uint8_t* begin, size_t length) const;

    /// Release the backing allocation now; the slice becomes empty.
    void release();

private:
    Slice slice_;
    utils::ArenaScope scope_;
};

} // namespace strata
