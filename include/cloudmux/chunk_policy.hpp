#pragma once

#include <cstdint>

namespace cloudmux {

constexpr uint64_t kMiB = 1024 * 1024;

class ChunkPolicy {
public:
    virtual ~ChunkPolicy() = default;
    virtual uint64_t chunk_size(uint64_t file_size) const = 0;
};

class FixedChunkPolicy : public ChunkPolicy {
public:
    explicit FixedChunkPolicy(uint64_t size) : size_(size) {}
    uint64_t chunk_size(uint64_t) const override { return size_; }

private:
    uint64_t size_;
};

/// Size-tiered slices for backends with a 999/1999 part-count ceiling:
///   size > base*2*999  -> max(ceil(ceil(size/1999)/base), 5) * base
///   size > base*999    -> 2 * base
///   otherwise          -> base
class TieredChunkPolicy : public ChunkPolicy {
public:
    explicit TieredChunkPolicy(uint64_t base = 10 * kMiB) : base_(base) {}
    uint64_t chunk_size(uint64_t file_size) const override;

private:
    uint64_t base_;
};

}  // namespace cloudmux
