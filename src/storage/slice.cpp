#include "storage/slice.h"
#include "storage/schema_errors.h"

#include <algorithm>
#include <cstring>
#include <functional>

namespace strata {

// static
Slice Slice::external(const uint8_t* data, size_t size) {
    if (size > kMaxSize) {
        throw IndexCorruptionException("Reading a slice that is too big to be a slice (" +
                                       std::to_string(size) + " bytes, max " +
                                       std::to_string(kMaxSize) + ")");
    }
    return Slice(data, static_cast<uint16_t>(size));
}

// static
Slice Slice::fromString(std::string_view str) {
    return external(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

void Slice::copyTo(uint8_t* dest) const {
    if (size_ > 0) {
        std::memcpy(dest, data_, size_);
    }
}

bool Slice::equals(const Slice& other) const {
    return size_ == other.size_ && (size_ == 0 || std::memcmp(data_, other.data_, size_) == 0);
}

int Slice::compare(const Slice& other) const {
    const size_t common = std::min(size_, other.size_);
    if (common > 0) {
        int r = std::memcmp(data_, other.data_, common);
        if (r != 0) return r;
    }
    return static_cast<int>(size_) - static_cast<int>(other.size_);
}

// ===== ScopedSlice =====

// static
ScopedSlice ScopedSlice::owned(utils::ArenaScope scope) {
    ScopedSlice s;
    s.slice_ = Slice::external(scope.data(), scope.size());
    s.scope_ = std::move(scope);
    return s;
}

ScopedSlice::ScopedSlice(ScopedSlice&& other) noexcept
    : slice_(other.slice_), scope_(std::move(other.scope_)) {
    other.slice_ = Slice();
}

ScopedSlice& ScopedSlice::operator=(ScopedSlice&& other) noexcept {
    if (this != &other) {
        scope_ = std::move(other.scope_);
        slice_ = other.slice_;
        other.slice_ = Slice();
    }
    return *this;
}

bool ScopedSlice::pointsInto(const uint8_t* begin, size_t length) const {
    const uint8_t* p = slice_.data();
    if (p == nullptr || begin == nullptr) {
        return false;
    }
    return std::less_equal<const uint8_t*>()(begin, p) && std::less<const uint8_t*>()(p, begin + length);
}

void ScopedSlice::release() {
    scope_.release();
    slice_ = Slice();
}

} // namespace strata
