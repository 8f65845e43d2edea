#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace strata {
namespace utils {

class ByteArena;

/// Handle for one arena allocation.
/// Move-only; the block goes back to the arena exactly once, either when the
/// scope is destroyed or when release() is called explicitly.
class ArenaScope {
public:
    ArenaScope() = default;
    ~ArenaScope();

    ArenaScope(ArenaScope&& other) noexcept;
    ArenaScope& operator=(ArenaScope&& other) noexcept;
    ArenaScope(const ArenaScope&) = delete;
    ArenaScope& operator=(const ArenaScope&) = delete;

    uint8_t* data() const { return data_; }
    size_t size() const { return size_; }
    bool valid() const { return arena_ != nullptr; }

    /// Return the block to the arena. Safe to call more than once.
    void release();

private:
    friend class ByteArena;
    ArenaScope(ByteArena* arena, uint8_t* data, size_t size)
        : arena_(arena), data_(data), size_(size) {}

    ByteArena* arena_ = nullptr;
    uint8_t* data_ = nullptr;
    size_t size_ = 0;
};

/// Per-transaction byte allocator.
///
/// Blocks are rounded up to power-of-two size classes and recycled through
/// per-class freelists until the pooled total reaches max_pooled_bytes.
/// Not thread-safe: one arena belongs to one transaction. Every ArenaScope
/// must be released before the arena is destroyed.
class ByteArena {
public:
    struct Stats {
        size_t live_allocations = 0;
        size_t live_bytes = 0;
        size_t peak_live_bytes = 0;
        size_t pooled_bytes = 0;
        uint64_t total_allocations = 0;
        uint64_t total_releases = 0;
        uint64_t reused_blocks = 0;
    };

    static constexpr size_t kMinBlockSize = 16;
    static constexpr size_t kDefaultMaxPooledBytes = 4 * 1024 * 1024;

    explicit ByteArena(size_t max_pooled_bytes = kDefaultMaxPooledBytes);
    ~ByteArena();

    ByteArena(const ByteArena&) = delete;
    ByteArena& operator=(const ByteArena&) = delete;

    /// Allocate `size` bytes (contents unspecified).
    ArenaScope allocate(size_t size);

    /// Allocate and fill with a copy of [src, src + size).
    ArenaScope copyFrom(const uint8_t* src, size_t size);

    const Stats& stats() const { return stats_; }
    size_t liveAllocations() const { return stats_.live_allocations; }

    /// Drop all pooled (free) blocks. Live allocations are untouched.
    void trim();

private:
    friend class ArenaScope;

    static constexpr size_t kBuckets = 48;

    void release(uint8_t* data, size_t size);
    static size_t blockSizeFor(size_t size);
    static size_t bucketFor(size_t block_size);

    size_t max_pooled_bytes_;
    Stats stats_;
    std::vector<uint8_t*> freelists_[kBuckets];
    std::unordered_map<uint8_t*, std::unique_ptr<uint8_t[]>> blocks_;
};

} // namespace utils
} // namespace strata
