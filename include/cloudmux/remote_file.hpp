#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace cloudmux {

struct RemoteFileHandle {
    std::string id;
    std::string name;
    std::string parent_id;
    uint64_t size = 0;
    bool is_directory = false;
    std::string checksum;  // backend-reported content hash, if any
    std::string modified;  // backend timestamp, as returned
};

struct ByteRange {
    uint64_t start = 0;
    std::optional<uint64_t> end;  // inclusive; nullopt = to end of file

    std::string header_value() const {
        return "bytes=" + std::to_string(start) + "-" + (end ? std::to_string(*end) : "");
    }
};

/// (bytes uploaded so far, total bytes)
using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

}  // namespace cloudmux
