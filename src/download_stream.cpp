#include "cloudmux/download_stream.hpp"
#include "cloudmux/log.hpp"

#include <algorithm>
#include <cstring>

namespace cloudmux {

namespace {

// "bytes 0-1023/4096" -> 4096
std::optional<uint64_t> content_range_total(const net::HttpHeaders& headers) {
    auto value = headers.get("Content-Range");
    if (!value) return std::nullopt;
    auto slash = value->rfind('/');
    if (slash == std::string::npos || slash + 1 >= value->size() || (*value)[slash + 1] == '*') {
        return std::nullopt;
    }
    try {
        return std::stoull(value->substr(slash + 1));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

TransferError link_error(const net::HttpResponse& response) {
    if (response.is_network_error) {
        return TransferError::make(ErrorKind::Network, response.error);
    }
    std::string message = response.body_string();
    if (message.size() > 512) message.resize(512);
    if (message.empty()) message = "HTTP " + std::to_string(response.status_code);
    return TransferError::make(ErrorKind::BackendRejected, message, "", response.status_code);
}

}  // namespace

// --- RangedDownload ---

RangedDownload::RangedDownload(std::shared_ptr<SignedExecutor> executor,
                               std::shared_ptr<const RequestSigner> signer,
                               DownloadTarget target, DownloadOptions options)
    : executor_(std::move(executor))
    , signer_(std::move(signer))
    , target_(std::move(target))
    , options_(std::move(options))
    , total_(target_.size) {
    if (options_.window_size == 0) options_.window_size = 8 * 1024 * 1024;
    if (options_.range) {
        next_offset_ = options_.range->start;
        last_offset_ = options_.range->end;
    }
    if (total_) {
        if (*total_ == 0 || next_offset_ >= *total_) {
            eof_ = true;
        } else if (!last_offset_ || *last_offset_ >= *total_) {
            last_offset_ = *total_ - 1;
        }
    }
}

net::HttpResponse RangedDownload::fetch_location(uint64_t first, uint64_t last,
                                                 const net::BodySink& sink) {
    auto request = net::HttpRequest::get(location_);
    request.byte_range = std::make_pair(first, last);
    requests_++;
    return executor_->transport().stream(request, sink);
}

std::optional<net::HttpResponse> RangedDownload::fetch(uint64_t first, uint64_t last) {
    const uint64_t cap = last - first + 1;
    auto sink = [this, cap](const uint8_t* data, size_t size) {
        if (window_.size() + size > cap) {
            overflow_ = true;
            return false;
        }
        window_.insert(window_.end(), data, data + size);
        return true;
    };

    if (!location_.empty()) {
        window_.clear();
        auto response = fetch_location(first, last, sink);
        if (overflow_ || response.ok()) return response;
        // Links expire; ask the API for a fresh one once
        log_warn("Cached download link failed (%s), resolving again",
                 link_error(response).describe().c_str());
        location_.clear();
    }

    net::HttpRequest request = target_.request;
    request.byte_range = std::make_pair(first, last);
    request.follow_redirects = false;

    UnsignedSigner unsigned_signer;
    const RequestSigner& signer =
        target_.signed_request && signer_ ? *signer_ : static_cast<const RequestSigner&>(unsigned_signer);

    window_.clear();
    requests_++;
    auto result = executor_->stream(request, signer, sink);
    if (overflow_) return result.response;

    int status = result.response.status_code;
    if (!result.response.is_network_error && net::is_redirect_status(status)) {
        auto location = result.response.headers.get("Location");
        if (!location || location->empty()) {
            error_ = TransferError::make(ErrorKind::BackendRejected, "redirect without Location",
                                         "", status);
            return std::nullopt;
        }
        location_ = *location;
        window_.clear();
        auto response = fetch_location(first, last, sink);
        if (!overflow_ && !response.ok()) {
            error_ = link_error(response);
            return std::nullopt;
        }
        return response;
    }

    if (!result.success) {
        error_ = result.error;
        return std::nullopt;
    }
    return result.response;
}

void RangedDownload::start_fallback() {
    DownloadTarget whole = target_;
    whole.supports_ranges = false;
    if (!location_.empty()) {
        whole.request = net::HttpRequest::get(location_);
        whole.signed_request = false;
    }
    DownloadOptions options;
    options.window_size = options_.window_size;

    log_warn("Server ignored range request for %s, streaming the whole body from offset %lu",
             whole.request.url.c_str(), static_cast<unsigned long>(next_offset_));
    window_.clear();
    window_pos_ = 0;
    skip_ = next_offset_;
    fallback_ = std::make_unique<PipedDownload>(executor_, signer_, std::move(whole),
                                                std::move(options));
}

bool RangedDownload::fetch_window() {
    if (eof_ || !error_.ok()) return false;
    if (last_offset_ && next_offset_ > *last_offset_) {
        eof_ = true;
        return false;
    }
    if (!target_.supports_ranges) {
        start_fallback();
        return false;
    }

    uint64_t first = next_offset_;
    uint64_t last = first + options_.window_size - 1;
    if (last_offset_) last = std::min(last, *last_offset_);

    auto response = fetch(first, last);
    if (overflow_) {
        // More bytes than the window asked for: the range was ignored
        start_fallback();
        return false;
    }
    if (!response) {
        log_error("Download window %lu-%lu failed: %s", static_cast<unsigned long>(first),
                  static_cast<unsigned long>(last), error_.describe().c_str());
        return false;
    }

    if (response->status_code == 206) {
        if (!total_) {
            total_ = content_range_total(response->headers);
            if (total_ && (!last_offset_ || *last_offset_ >= *total_)) last_offset_ = *total_ - 1;
        }
        if (window_.size() < last - first + 1) eof_ = true;
    } else {
        // A whole body that fit in one window: the file starts at byte 0
        if (first >= window_.size()) {
            window_.clear();
        } else if (first > 0) {
            window_.erase(window_.begin(), window_.begin() + static_cast<std::ptrdiff_t>(first));
        }
        if (last_offset_ && window_.size() > *last_offset_ - first + 1) {
            window_.resize(*last_offset_ - first + 1);
        }
        eof_ = true;
    }

    if (window_.empty()) {
        eof_ = true;
        return false;
    }

    next_offset_ += window_.size();
    window_pos_ = 0;
    return true;
}

size_t RangedDownload::read_fallback(uint8_t* buffer, size_t size) {
    while (skip_ > 0) {
        uint8_t scratch[16 * 1024];
        size_t n = fallback_->read(scratch, std::min<uint64_t>(skip_, sizeof(scratch)));
        if (n == 0) {
            error_ = fallback_->failure();
            if (error_.ok()) {
                error_ = TransferError::make(ErrorKind::IntegrityMismatch,
                                             "body ended before offset " +
                                                 std::to_string(next_offset_));
            }
            return 0;
        }
        skip_ -= n;
    }

    if (last_offset_) {
        if (next_offset_ > *last_offset_) {
            eof_ = true;
            fallback_->close();
            return 0;
        }
        size = static_cast<size_t>(std::min<uint64_t>(size, *last_offset_ - next_offset_ + 1));
    }

    size_t n = fallback_->read(buffer, size);
    if (n == 0) {
        error_ = fallback_->failure();
        eof_ = true;
        return 0;
    }
    next_offset_ += n;
    delivered_ += n;
    if (options_.bytes_counter) *options_.bytes_counter += n;
    return n;
}

size_t RangedDownload::read(uint8_t* buffer, size_t size) {
    if (!fallback_ && window_pos_ >= window_.size()) {
        window_.clear();
        window_pos_ = 0;
        if (!fetch_window() && !fallback_) return 0;
    }
    if (fallback_) {
        if (eof_ || !error_.ok()) return 0;
        return read_fallback(buffer, size);
    }
    size_t n = std::min(size, window_.size() - window_pos_);
    std::memcpy(buffer, window_.data() + window_pos_, n);
    window_pos_ += n;
    delivered_ += n;
    if (options_.bytes_counter) *options_.bytes_counter += n;
    return n;
}

// --- PipedDownload ---

PipedDownload::PipedDownload(std::shared_ptr<SignedExecutor> executor,
                             std::shared_ptr<const RequestSigner> signer,
                             DownloadTarget target, DownloadOptions options)
    : executor_(std::move(executor))
    , signer_(std::move(signer))
    , target_(std::move(target))
    , options_(std::move(options)) {
    if (options_.window_size == 0) options_.window_size = 8 * 1024 * 1024;
    ring_.resize(options_.window_size);
    producer_ = std::thread(&PipedDownload::produce, this);
}

PipedDownload::~PipedDownload() {
    close();
    if (producer_.joinable()) producer_.join();
}

void PipedDownload::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

TransferError PipedDownload::failure() const {
    std::lock_guard lock(mutex_);
    return error_;
}

bool PipedDownload::push(const uint8_t* data, size_t size) {
    std::unique_lock lock(mutex_);
    size_t pushed = 0;
    while (pushed < size) {
        cv_.wait(lock, [this] { return closed_ || used_ < ring_.size(); });
        if (closed_) return false;

        size_t tail = (head_ + used_) % ring_.size();
        size_t n = std::min(size - pushed, ring_.size() - used_);
        n = std::min(n, ring_.size() - tail);
        std::memcpy(ring_.data() + tail, data + pushed, n);
        used_ += n;
        pushed += n;
        cv_.notify_all();
    }
    return true;
}

void PipedDownload::produce() {
    net::HttpRequest request = target_.request;
    request.follow_redirects = false;
    if (options_.range) request.headers.set("Range", options_.range->header_value());

    UnsignedSigner unsigned_signer;
    const RequestSigner& signer =
        target_.signed_request && signer_ ? *signer_ : static_cast<const RequestSigner&>(unsigned_signer);

    auto sink = [this](const uint8_t* data, size_t size) { return push(data, size); };

    requests_++;
    auto result = executor_->stream(request, signer, sink);

    TransferError error;
    int status = result.response.status_code;
    if (!result.response.is_network_error && net::is_redirect_status(status)) {
        auto location = result.response.headers.get("Location");
        if (location && !location->empty()) {
            auto follow = net::HttpRequest::get(*location);
            if (options_.range) follow.headers.set("Range", options_.range->header_value());
            requests_++;
            auto response = executor_->transport().stream(follow, sink);
            if (!response.ok()) error = link_error(response);
        } else {
            error = TransferError::make(ErrorKind::BackendRejected, "redirect without Location",
                                        "", status);
        }
    } else if (!result.success) {
        error = result.error;
    }

    {
        std::lock_guard lock(mutex_);
        // A closed consumer aborts the transfer; that is not a failure
        if (!closed_) error_ = error;
        done_ = true;
    }
    cv_.notify_all();
}

size_t PipedDownload::read(uint8_t* buffer, size_t size) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return used_ > 0 || done_ || closed_; });
    if (used_ == 0) return 0;

    size_t n = std::min(size, used_);
    n = std::min(n, ring_.size() - head_);
    std::memcpy(buffer, ring_.data() + head_, n);
    head_ = (head_ + n) % ring_.size();
    used_ -= n;
    lock.unlock();
    cv_.notify_all();

    delivered_ += n;
    if (options_.bytes_counter) *options_.bytes_counter += n;
    return n;
}

std::unique_ptr<DownloadStream> open_download(std::shared_ptr<SignedExecutor> executor,
                                              std::shared_ptr<const RequestSigner> signer,
                                              DownloadTarget target,
                                              DownloadOptions options) {
    if (target.supports_ranges) {
        return std::make_unique<RangedDownload>(std::move(executor), std::move(signer),
                                                std::move(target), std::move(options));
    }
    return std::make_unique<PipedDownload>(std::move(executor), std::move(signer),
                                           std::move(target), std::move(options));
}

}  // namespace cloudmux
