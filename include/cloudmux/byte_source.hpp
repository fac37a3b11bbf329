#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace cloudmux {

/// Pull-based byte stream feeding uploads.
///
/// read() returns the number of bytes copied, 0 at end of stream or on
/// error; error() distinguishes the two. Seekable sources can be rewound
/// for a second pass (full hash, then upload).
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual size_t read(uint8_t* buffer, size_t size) = 0;
    virtual bool seekable() const = 0;
    virtual bool seek(uint64_t offset) = 0;
    virtual std::optional<uint64_t> size() const = 0;
    virtual std::string error() const { return {}; }
};

class FileSource : public ByteSource {
public:
    explicit FileSource(const std::filesystem::path& path);
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    bool is_open() const { return file_ != nullptr; }

    size_t read(uint8_t* buffer, size_t size) override;
    bool seekable() const override { return true; }
    bool seek(uint64_t offset) override;
    std::optional<uint64_t> size() const override { return size_; }
    std::string error() const override { return error_; }

private:
    FILE* file_ = nullptr;
    std::optional<uint64_t> size_;
    std::string error_;
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<uint8_t> data) : data_(std::move(data)) {}
    explicit MemorySource(const std::string& data) : data_(data.begin(), data.end()) {}

    size_t read(uint8_t* buffer, size_t size) override;
    bool seekable() const override { return true; }
    bool seek(uint64_t offset) override;
    std::optional<uint64_t> size() const override { return data_.size(); }

private:
    std::vector<uint8_t> data_;
    size_t position_ = 0;
};

/// One-shot stream (pipe, socket, stdin). Not seekable.
class StreamSource : public ByteSource {
public:
    StreamSource(std::istream& in, std::optional<uint64_t> declared_size = std::nullopt)
        : in_(in), declared_size_(declared_size) {}

    size_t read(uint8_t* buffer, size_t size) override;
    bool seekable() const override { return false; }
    bool seek(uint64_t) override { return false; }
    std::optional<uint64_t> size() const override { return declared_size_; }
    std::string error() const override { return error_; }

private:
    std::istream& in_;
    std::optional<uint64_t> declared_size_;
    std::string error_;
};

/// Replays bytes already consumed from a one-shot source (e.g. the prefix
/// read for a partial hash) before continuing with the rest of it. The
/// prefix buffer is released once drained.
class PrefixReplaySource : public ByteSource {
public:
    PrefixReplaySource(std::vector<uint8_t> prefix, ByteSource& rest)
        : prefix_(std::move(prefix)), rest_(rest) {}

    size_t read(uint8_t* buffer, size_t size) override;
    bool seekable() const override { return false; }
    bool seek(uint64_t) override { return false; }
    std::optional<uint64_t> size() const override { return rest_.size(); }
    std::string error() const override { return rest_.error(); }

private:
    std::vector<uint8_t> prefix_;
    size_t position_ = 0;
    ByteSource& rest_;
};

/// Read until `size` bytes or end of stream.
size_t read_fully(ByteSource& source, uint8_t* buffer, size_t size);

}  // namespace cloudmux
