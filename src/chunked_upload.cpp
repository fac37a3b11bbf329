#include "cloudmux/chunked_upload.hpp"
#include "cloudmux/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace cloudmux {

const char* transfer_state_name(TransferState state) {
    switch (state) {
        case TransferState::Uninitialized: return "uninitialized";
        case TransferState::SessionOpen: return "session-open";
        case TransferState::Buffering: return "buffering";
        case TransferState::ChunkInFlight: return "chunk-in-flight";
        case TransferState::Committing: return "committing";
        case TransferState::Complete: return "complete";
        case TransferState::Aborted: return "aborted";
    }
    return "unknown";
}

// --- UploadProtocol defaults ---

TransferError UploadProtocol::resolve_part_target(SignedExecutor&, UploadSession& session,
                                                  PartDescriptor& part,
                                                  std::span<const uint8_t>) {
    auto it = session.prefetched_targets.find(part.part_number);
    if (it == session.prefetched_targets.end()) {
        return TransferError::make(ErrorKind::Precondition,
                                   "no upload URL for part " + std::to_string(part.part_number));
    }
    part.target = it->second;
    session.prefetched_targets.erase(it);
    return {};
}

TransferError UploadProtocol::upload_part(SignedExecutor& executor, UploadSession&,
                                          PartDescriptor& part, std::span<const uint8_t> data) {
    if (!part.target) {
        return TransferError::make(ErrorKind::Precondition,
                                   "part " + std::to_string(part.part_number) + " has no target");
    }

    net::HttpRequest request;
    request.method = part.target->method;
    request.url = part.target->url;
    request.body_view = data;
    for (const auto& [name, value] : part.target->headers) {
        request.headers.set(name, value);
    }

    UnsignedSigner unsigned_signer;
    auto result = executor.execute(request, unsigned_signer);
    if (!result.success) {
        if (part_conflict_is_success() && result.response.status_code == 409) {
            log_debug("Part %u already present remotely", part.part_number);
            return {};
        }
        return result.error;
    }
    part.etag = result.response.headers.get("ETag").value_or("");
    return {};
}

// --- ChunkedUpload ---

ChunkedUpload::ChunkedUpload(SignedExecutor& executor, UploadProtocol& protocol,
                             UploadSession session, std::vector<uint8_t>& buffer)
    : executor_(executor)
    , protocol_(protocol)
    , session_(std::move(session))
    , buffer_(buffer) {
    if (session_.chunk_size > 0 && buffer_.size() < session_.chunk_size) {
        buffer_.resize(session_.chunk_size);
    }
    if (auto algorithm = protocol_.content_digest()) {
        digest_.emplace(*algorithm);
    }
}

TransferState ChunkedUpload::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

TransferError ChunkedUpload::fail(TransferError error) {
    {
        std::lock_guard lock(mutex_);
        state_ = TransferState::Aborted;
        last_error_ = error;
    }
    cv_.notify_all();
    return error;
}

TransferError ChunkedUpload::open() {
    {
        std::lock_guard lock(mutex_);
        if (state_ != TransferState::Uninitialized) {
            return TransferError::make(ErrorKind::Precondition,
                                       std::string("open in state ") + transfer_state_name(state_));
        }
    }
    if (session_.chunk_size == 0) {
        return fail(TransferError::make(ErrorKind::Precondition, "chunk size is zero"));
    }

    auto err = protocol_.open_session(executor_, session_);
    if (!err.ok()) return fail(err);

    std::lock_guard lock(mutex_);
    state_ = TransferState::SessionOpen;
    log_debug("Upload session open for %s (%lu bytes, chunk %lu)", session_.name.c_str(),
              static_cast<unsigned long>(session_.total_size),
              static_cast<unsigned long>(session_.chunk_size));
    return {};
}

TransferError ChunkedUpload::flush_locked(std::unique_lock<std::mutex>& lock) {
    if (cancelled()) {
        state_ = TransferState::Aborted;
        last_error_ = TransferError::make(ErrorKind::Cancelled, "upload cancelled");
        cv_.notify_all();
        return last_error_;
    }

    PartDescriptor part;
    part.part_number = static_cast<uint32_t>(session_.parts.size() + 1);
    part.offset = session_.uploaded_bytes;
    part.size = filled_;
    std::span<const uint8_t> data(buffer_.data(), filled_);

    state_ = TransferState::ChunkInFlight;
    lock.unlock();

    if (digest_) digest_->update(data);

    TransferError err = protocol_.resolve_part_target(executor_, session_, part, data);
    if (err.ok()) {
        err = protocol_.upload_part(executor_, session_, part, data);
    }

    lock.lock();
    chunk_calls_++;
    if (state_ == TransferState::Aborted) {
        // abort() arrived while the part was on the wire
        cv_.notify_all();
        return last_error_;
    }
    if (!err.ok()) {
        state_ = TransferState::Aborted;
        last_error_ = err;
        cv_.notify_all();
        log_error("Part %u of %s failed: %s", part.part_number, session_.name.c_str(),
                  err.describe().c_str());
        return err;
    }

    part.uploaded = true;
    session_.uploaded_bytes += part.size;
    session_.parts.push_back(std::move(part));
    filled_ = 0;
    state_ = TransferState::Buffering;
    cv_.notify_all();

    if (progress_) {
        uint64_t uploaded = session_.uploaded_bytes;
        uint64_t total = session_.total_size;
        lock.unlock();
        progress_(uploaded, total);
        lock.lock();
    }
    return {};
}

TransferError ChunkedUpload::write(std::span<const uint8_t> data) {
    std::unique_lock lock(mutex_);
    size_t consumed = 0;
    while (consumed < data.size()) {
        cv_.wait(lock, [this] { return state_ != TransferState::ChunkInFlight; });
        if (state_ == TransferState::Aborted) return last_error_;
        if (state_ != TransferState::SessionOpen && state_ != TransferState::Buffering) {
            return TransferError::make(ErrorKind::Precondition,
                                       std::string("write in state ") + transfer_state_name(state_));
        }
        state_ = TransferState::Buffering;

        size_t room = session_.chunk_size - filled_;
        size_t n = std::min(room, data.size() - consumed);
        std::memcpy(buffer_.data() + filled_, data.data() + consumed, n);
        filled_ += n;
        consumed += n;
        bytes_written_ += n;
        peak_buffered_ = std::max(peak_buffered_, filled_);

        if (filled_ == session_.chunk_size) {
            auto err = flush_locked(lock);
            if (!err.ok()) return err;
        }
    }
    return {};
}

TransferError ChunkedUpload::pump(ByteSource& source) {
    std::unique_lock lock(mutex_);
    for (;;) {
        cv_.wait(lock, [this] { return state_ != TransferState::ChunkInFlight; });
        if (state_ == TransferState::Aborted) return last_error_;
        if (state_ != TransferState::SessionOpen && state_ != TransferState::Buffering) {
            return TransferError::make(ErrorKind::Precondition,
                                       std::string("pump in state ") + transfer_state_name(state_));
        }
        state_ = TransferState::Buffering;

        size_t room = session_.chunk_size - filled_;
        size_t n = read_fully(source, buffer_.data() + filled_, room);
        filled_ += n;
        bytes_written_ += n;
        peak_buffered_ = std::max(peak_buffered_, filled_);

        if (!source.error().empty()) {
            lock.unlock();
            return fail(TransferError::make(ErrorKind::Precondition, source.error()));
        }
        if (filled_ == session_.chunk_size) {
            auto err = flush_locked(lock);
            if (!err.ok()) return err;
            continue;
        }
        // Short read: end of stream
        return {};
    }
}

TransferError ChunkedUpload::check_commit_ready(const UploadSession& session) {
    uint64_t expected_offset = 0;
    for (size_t i = 0; i < session.parts.size(); ++i) {
        const auto& part = session.parts[i];
        if (part.part_number != i + 1) {
            return TransferError::make(ErrorKind::Precondition,
                                       "part " + std::to_string(i + 1) + " missing or out of order");
        }
        if (!part.uploaded) {
            return TransferError::make(ErrorKind::Precondition,
                                       "part " + std::to_string(part.part_number) + " not uploaded");
        }
        if (part.offset != expected_offset) {
            return TransferError::make(ErrorKind::Precondition,
                                       "part " + std::to_string(part.part_number) +
                                           " does not follow its predecessor");
        }
        expected_offset += part.size;
    }
    if (expected_offset != session.total_size) {
        return TransferError::make(ErrorKind::Precondition,
                                   "parts cover " + std::to_string(expected_offset) + " of " +
                                       std::to_string(session.total_size) + " bytes");
    }
    return {};
}

CommitResult ChunkedUpload::finish() {
    CommitResult result;
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return state_ != TransferState::ChunkInFlight; });
    if (state_ == TransferState::Aborted) {
        result.error = last_error_;
        return result;
    }
    if (state_ != TransferState::SessionOpen && state_ != TransferState::Buffering) {
        result.error = TransferError::make(ErrorKind::Precondition,
                                           std::string("finish in state ") + transfer_state_name(state_));
        return result;
    }

    if (filled_ > 0) {
        auto err = flush_locked(lock);
        if (!err.ok()) {
            result.error = err;
            return result;
        }
    }

    if (bytes_written_ != session_.total_size) {
        state_ = TransferState::Aborted;
        last_error_ = TransferError::make(
            ErrorKind::IntegrityMismatch,
            "stream delivered " + std::to_string(bytes_written_) + " bytes, declared " +
                std::to_string(session_.total_size));
        result.error = last_error_;
        return result;
    }

    auto ready = check_commit_ready(session_);
    if (!ready.ok()) {
        state_ = TransferState::Aborted;
        last_error_ = ready;
        result.error = ready;
        return result;
    }

    state_ = TransferState::Committing;
    lock.unlock();

    std::string content_digest;
    if (digest_) content_digest = digest_->finish_hex(false);

    result = protocol_.commit(executor_, session_, content_digest);
    if (result.success && !content_digest.empty() && !result.checksum.empty()) {
        std::string reported = result.checksum;
        std::transform(reported.begin(), reported.end(), reported.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (reported != content_digest) {
            result.success = false;
            result.error = TransferError::make(ErrorKind::IntegrityMismatch,
                                               "backend checksum " + result.checksum +
                                                   " differs from local " + content_digest);
        }
    }

    lock.lock();
    if (!result.success) {
        if (result.error.ok()) {
            result.error = TransferError::make(ErrorKind::BackendRejected, "commit failed");
        }
        state_ = TransferState::Aborted;
        last_error_ = result.error;
        return result;
    }
    if (result.handle.size == 0) result.handle.size = session_.total_size;
    if (result.handle.name.empty()) result.handle.name = session_.name;
    if (result.handle.parent_id.empty()) result.handle.parent_id = session_.parent_id;
    state_ = TransferState::Complete;
    return result;
}

void ChunkedUpload::abort() {
    {
        std::lock_guard lock(mutex_);
        if (state_ == TransferState::Complete || state_ == TransferState::Aborted) return;
        state_ = TransferState::Aborted;
        last_error_ = TransferError::make(ErrorKind::Cancelled, "upload aborted");
    }
    cv_.notify_all();
}

}  // namespace cloudmux
