#include "utils/byte_arena.h"
#include "utils/logger.h"

#include <algorithm>
#include <cstring>
#include <new>

namespace strata {
namespace utils {

// ===== ArenaScope =====

ArenaScope::~ArenaScope() {
    release();
}

ArenaScope::ArenaScope(ArenaScope&& other) noexcept
    : arena_(other.arena_), data_(other.data_), size_(other.size_) {
    other.arena_ = nullptr;
    other.data_ = nullptr;
    other.size_ = 0;
}

ArenaScope& ArenaScope::operator=(ArenaScope&& other) noexcept {
    if (this != &other) {
        release();
        arena_ = other.arena_;
        data_ = other.data_;
        size_ = other.size_;
        other.arena_ = nullptr;
        other.data_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void ArenaScope::release() {
    if (arena_) {
        arena_->release(data_, size_);
        arena_ = nullptr;
        data_ = nullptr;
        size_ = 0;
    }
}

// ===== ByteArena =====

ByteArena::ByteArena(size_t max_pooled_bytes) : max_pooled_bytes_(max_pooled_bytes) {}

ByteArena::~ByteArena() {
    if (stats_.live_allocations != 0) {
        STRATA_ERROR("ByteArena destroyed with {} live allocation(s) ({} bytes)",
                     stats_.live_allocations, stats_.live_bytes);
    }
}

// static
size_t ByteArena::blockSizeFor(size_t size) {
    size_t block = kMinBlockSize;
    while (block < size) {
        if (block > (SIZE_MAX >> 1)) {
            throw std::bad_alloc();
        }
        block <<= 1;
    }
    return block;
}

// static
size_t ByteArena::bucketFor(size_t block_size) {
    size_t bucket = 0;
    while ((kMinBlockSize << bucket) < block_size) {
        ++bucket;
    }
    return std::min(bucket, kBuckets - 1);
}

ArenaScope ByteArena::allocate(size_t size) {
    const size_t block_size = blockSizeFor(size);
    const size_t bucket = bucketFor(block_size);

    uint8_t* data = nullptr;
    auto& freelist = freelists_[bucket];
    if (!freelist.empty() && (kMinBlockSize << bucket) == block_size) {
        data = freelist.back();
        freelist.pop_back();
        stats_.pooled_bytes -= block_size;
        ++stats_.reused_blocks;
    } else {
        auto block = std::make_unique<uint8_t[]>(block_size);
        data = block.get();
        blocks_.emplace(data, std::move(block));
    }

    ++stats_.live_allocations;
    ++stats_.total_allocations;
    stats_.live_bytes += size;
    stats_.peak_live_bytes = std::max(stats_.peak_live_bytes, stats_.live_bytes);
    return ArenaScope(this, data, size);
}

ArenaScope ByteArena::copyFrom(const uint8_t* src, size_t size) {
    ArenaScope scope = allocate(size);
    if (size > 0) {
        std::memcpy(scope.data(), src, size);
    }
    return scope;
}

void ByteArena::release(uint8_t* data, size_t size) {
    const size_t block_size = blockSizeFor(size);
    const size_t bucket = bucketFor(block_size);

    --stats_.live_allocations;
    ++stats_.total_releases;
    stats_.live_bytes -= size;

    if ((kMinBlockSize << bucket) == block_size &&
        stats_.pooled_bytes + block_size <= max_pooled_bytes_) {
        freelists_[bucket].push_back(data);
        stats_.pooled_bytes += block_size;
        return;
    }
    blocks_.erase(data);
}

void ByteArena::trim() {
    for (auto& freelist : freelists_) {
        for (uint8_t* data : freelist) {
            blocks_.erase(data);
        }
        freelist.clear();
    }
    stats_.pooled_bytes = 0;
}

} // namespace utils
} // namespace strata
