#pragma once

#include "cloudmux/byte_source.hpp"
#include "cloudmux/crypto.hpp"
#include "cloudmux/error.hpp"
#include "cloudmux/net/http.hpp"
#include "cloudmux/remote_file.hpp"
#include "cloudmux/signed_executor.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cloudmux {

enum class TransferState {
    Uninitialized,
    SessionOpen,
    Buffering,
    ChunkInFlight,
    Committing,
    Complete,
    Aborted
};

const char* transfer_state_name(TransferState state);

/// Where one part goes. Presigned URLs carry their own auth in the URL
/// or in `headers`.
struct PartTarget {
    std::string url;
    net::HttpMethod method = net::HttpMethod::PUT;
    std::vector<std::pair<std::string, std::string>> headers;
};

struct PartDescriptor {
    uint32_t part_number = 0;  // 1-based
    uint64_t offset = 0;
    uint64_t size = 0;
    std::optional<PartTarget> target;
    bool uploaded = false;
    std::string etag;
    std::string checksum;  // per-part digest, for backends that want one
};

struct UploadSession {
    std::string remote_id;  // may only be known after commit
    std::string upload_id;
    std::string parent_id;
    std::string name;
    uint64_t total_size = 0;
    uint64_t chunk_size = 0;
    uint64_t uploaded_bytes = 0;
    std::vector<PartDescriptor> parts;
    /// Targets handed out by open_session, keyed by part number
    std::map<uint32_t, PartTarget> prefetched_targets;
    std::map<std::string, std::string> attributes;
};

struct CommitResult {
    bool success = false;
    RemoteFileHandle handle;
    std::string checksum;  // backend's view of the content digest, if reported
    TransferError error;
};

/// Backend half of a chunked upload. The state machine calls these in a
/// fixed order: open_session once, then resolve_part_target and
/// upload_part per part in ascending order, then commit once.
class UploadProtocol {
public:
    virtual ~UploadProtocol() = default;

    virtual TransferError open_session(SignedExecutor& executor, UploadSession& session) = 0;

    /// Fill part.target (and part.checksum) before the part is sent.
    /// The default takes a target prefetched by open_session.
    virtual TransferError resolve_part_target(SignedExecutor& executor, UploadSession& session,
                                              PartDescriptor& part,
                                              std::span<const uint8_t> data);

    /// Send one part. The default PUTs the bytes to part.target unsigned.
    virtual TransferError upload_part(SignedExecutor& executor, UploadSession& session,
                                      PartDescriptor& part, std::span<const uint8_t> data);

    virtual CommitResult commit(SignedExecutor& executor, UploadSession& session,
                                const std::string& content_digest) = 0;

    /// Digest computed over the whole stream while uploading, if wanted.
    virtual std::optional<crypto::DigestAlgorithm> content_digest() const { return std::nullopt; }

    /// A 409 on a part PUT means the backend already holds that part.
    virtual bool part_conflict_is_success() const { return false; }
};

/// Bounded-memory upload of one stream: exactly one chunk is resident and
/// at most one part is in flight. Parts go out strictly in order. Writers
/// block while a part is being sent.
class ChunkedUpload {
public:
    ChunkedUpload(SignedExecutor& executor, UploadProtocol& protocol,
                  UploadSession session, std::vector<uint8_t>& buffer);

    ChunkedUpload(const ChunkedUpload&) = delete;
    ChunkedUpload& operator=(const ChunkedUpload&) = delete;

    TransferError open();
    TransferError write(std::span<const uint8_t> data);
    /// Read the source to EOF through the chunk buffer.
    TransferError pump(ByteSource& source);
    CommitResult finish();
    void abort();

    /// Precondition for commit: parts 1..N present, ascending, uploaded,
    /// and covering the declared size.
    static TransferError check_commit_ready(const UploadSession& session);

    void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }
    void set_cancel_flag(const std::atomic<bool>* cancel) { cancel_ = cancel; }

    TransferState state() const;
    const UploadSession& session() const { return session_; }
    size_t peak_buffered() const { return peak_buffered_; }
    uint64_t chunk_calls() const { return chunk_calls_; }
    uint64_t bytes_written() const { return bytes_written_; }

private:
    TransferError flush_locked(std::unique_lock<std::mutex>& lock);
    TransferError fail(TransferError error);
    bool cancelled() const { return cancel_ && cancel_->load(); }

    SignedExecutor& executor_;
    UploadProtocol& protocol_;
    UploadSession session_;
    std::vector<uint8_t>& buffer_;
    size_t filled_ = 0;

    std::optional<crypto::Digest> digest_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    TransferState state_ = TransferState::Uninitialized;
    TransferError last_error_;

    ProgressCallback progress_;
    const std::atomic<bool>* cancel_ = nullptr;

    size_t peak_buffered_ = 0;
    uint64_t chunk_calls_ = 0;
    uint64_t bytes_written_ = 0;
};

}  // namespace cloudmux
