#include "cloudmux/chunk_policy.hpp"

#include <algorithm>

namespace cloudmux {

uint64_t TieredChunkPolicy::chunk_size(uint64_t file_size) const {
    if (file_size > base_ * 2 * 999) {
        uint64_t per_part = (file_size + 1998) / 1999;
        uint64_t multiples = (per_part + base_ - 1) / base_;
        return std::max<uint64_t>(multiples, 5) * base_;
    }
    if (file_size > base_ * 999) {
        return base_ * 2;
    }
    return base_;
}

}  // namespace cloudmux
