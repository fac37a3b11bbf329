#pragma once

#include "cloudmux/byte_source.hpp"
#include "cloudmux/error.hpp"
#include "cloudmux/net/http.hpp"
#include "cloudmux/remote_file.hpp"
#include "cloudmux/signed_executor.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace cloudmux {

/// How to fetch a file body: the request (API call that answers with the
/// bytes or with a redirect to them) and whether it must be signed.
struct DownloadTarget {
    net::HttpRequest request;
    bool signed_request = true;
    bool supports_ranges = true;
    std::optional<uint64_t> size;
};

struct DownloadOptions {
    size_t window_size = 8 * 1024 * 1024;
    std::optional<ByteRange> range;
    std::atomic<uint64_t>* bytes_counter = nullptr;
};

/// Pull-based download. read() blocks until bytes are available and
/// returns 0 at end of stream or on failure; failure() tells which.
class DownloadStream : public ByteSource {
public:
    bool seekable() const override { return false; }
    bool seek(uint64_t) override { return false; }
    std::string error() const override { return failure().message; }

    virtual TransferError failure() const = 0;
    virtual uint64_t delivered() const = 0;
    /// Number of HTTP requests issued so far
    virtual uint64_t requests() const = 0;
};

/// One full-body request streamed by a producer thread into a bounded
/// pipe of window_size bytes. The consumer's read() drains it.
class PipedDownload : public DownloadStream {
public:
    PipedDownload(std::shared_ptr<SignedExecutor> executor,
                  std::shared_ptr<const RequestSigner> signer,
                  DownloadTarget target, DownloadOptions options);
    ~PipedDownload() override;

    PipedDownload(const PipedDownload&) = delete;
    PipedDownload& operator=(const PipedDownload&) = delete;

    size_t read(uint8_t* buffer, size_t size) override;
    std::optional<uint64_t> size() const override { return target_.size; }
    TransferError failure() const override;
    uint64_t delivered() const override { return delivered_.load(); }
    uint64_t requests() const override { return requests_.load(); }

    void close();

private:
    void produce();
    bool push(const uint8_t* data, size_t size);

    std::shared_ptr<SignedExecutor> executor_;
    std::shared_ptr<const RequestSigner> signer_;
    DownloadTarget target_;
    DownloadOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<uint8_t> ring_;
    size_t head_ = 0;
    size_t used_ = 0;
    bool done_ = false;
    bool closed_ = false;
    TransferError error_;

    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> requests_{0};
    std::thread producer_;
};

/// Sequential range windows of at most window_size bytes each. The first
/// request does not follow redirects; a 302/307 Location is cached and
/// fetched unsigned on the transport, and resolved again once if the
/// cached link stops working. Each window is streamed into a buffer capped
/// at the window size; a server that answers with more than the window
/// ignored the range, and the rest of the body is then read through a
/// PipedDownload instead.
class RangedDownload : public DownloadStream {
public:
    RangedDownload(std::shared_ptr<SignedExecutor> executor,
                   std::shared_ptr<const RequestSigner> signer,
                   DownloadTarget target, DownloadOptions options);

    size_t read(uint8_t* buffer, size_t size) override;
    std::optional<uint64_t> size() const override { return total_; }
    TransferError failure() const override { return error_; }
    uint64_t delivered() const override { return delivered_; }
    uint64_t requests() const override {
        return requests_ + (fallback_ ? fallback_->requests() : 0);
    }

private:
    bool fetch_window();
    std::optional<net::HttpResponse> fetch(uint64_t first, uint64_t last);
    net::HttpResponse fetch_location(uint64_t first, uint64_t last, const net::BodySink& sink);
    void start_fallback();
    size_t read_fallback(uint8_t* buffer, size_t size);

    std::shared_ptr<SignedExecutor> executor_;
    std::shared_ptr<const RequestSigner> signer_;
    DownloadTarget target_;
    DownloadOptions options_;

    std::optional<uint64_t> total_;
    uint64_t next_offset_ = 0;
    std::optional<uint64_t> last_offset_;  // inclusive
    bool eof_ = false;

    std::string location_;
    std::vector<uint8_t> window_;
    size_t window_pos_ = 0;
    bool overflow_ = false;

    std::unique_ptr<PipedDownload> fallback_;
    uint64_t skip_ = 0;  // leading bytes of the fallback body already delivered

    TransferError error_;
    uint64_t delivered_ = 0;
    uint64_t requests_ = 0;
};

/// Ranged windows when the target supports them, otherwise a pipe.
std::unique_ptr<DownloadStream> open_download(std::shared_ptr<SignedExecutor> executor,
                                              std::shared_ptr<const RequestSigner> signer,
                                              DownloadTarget target,
                                              DownloadOptions options);

}  // namespace cloudmux
