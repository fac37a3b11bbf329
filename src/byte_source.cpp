#include "cloudmux/byte_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace cloudmux {

// --- FileSource ---

FileSource::FileSource(const std::filesystem::path& path) {
    file_ = std::fopen(path.c_str(), "rb");
    if (!file_) {
        error_ = "cannot open " + path.string() + ": " + std::strerror(errno);
        return;
    }
    std::error_code ec;
    auto sz = std::filesystem::file_size(path, ec);
    if (!ec) size_ = sz;
}

FileSource::~FileSource() {
    if (file_) std::fclose(file_);
}

size_t FileSource::read(uint8_t* buffer, size_t size) {
    if (!file_) return 0;
    size_t n = std::fread(buffer, 1, size, file_);
    if (n < size && std::ferror(file_)) {
        error_ = std::string("read failed: ") + std::strerror(errno);
    }
    return n;
}

bool FileSource::seek(uint64_t offset) {
    if (!file_) return false;
    if (fseeko(file_, static_cast<off_t>(offset), SEEK_SET) != 0) {
        error_ = std::string("seek failed: ") + std::strerror(errno);
        return false;
    }
    return true;
}

// --- MemorySource ---

size_t MemorySource::read(uint8_t* buffer, size_t size) {
    size_t n = std::min(size, data_.size() - position_);
    if (n > 0) {
        std::memcpy(buffer, data_.data() + position_, n);
        position_ += n;
    }
    return n;
}

bool MemorySource::seek(uint64_t offset) {
    if (offset > data_.size()) return false;
    position_ = static_cast<size_t>(offset);
    return true;
}

// --- StreamSource ---

size_t StreamSource::read(uint8_t* buffer, size_t size) {
    if (!in_.good()) return 0;
    in_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(size));
    if (in_.bad()) {
        error_ = "stream read failed";
    }
    return static_cast<size_t>(in_.gcount());
}

// --- PrefixReplaySource ---

size_t PrefixReplaySource::read(uint8_t* buffer, size_t size) {
    if (position_ < prefix_.size()) {
        size_t n = std::min(size, prefix_.size() - position_);
        std::memcpy(buffer, prefix_.data() + position_, n);
        position_ += n;
        if (position_ == prefix_.size()) {
            std::vector<uint8_t>().swap(prefix_);
            position_ = 0;
        }
        return n;
    }
    return rest_.read(buffer, size);
}

size_t read_fully(ByteSource& source, uint8_t* buffer, size_t size) {
    size_t total = 0;
    while (total < size) {
        size_t n = source.read(buffer + total, size - total);
        if (n == 0) break;
        total += n;
    }
    return total;
}

}  // namespace cloudmux
