#pragma once

#include "cloudmux/backend_adapter.hpp"
#include "cloudmux/byte_source.hpp"
#include "cloudmux/chunked_upload.hpp"
#include "cloudmux/credential_session.hpp"
#include "cloudmux/dedup.hpp"
#include "cloudmux/download_stream.hpp"
#include "cloudmux/remote_file.hpp"
#include "cloudmux/signed_executor.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace cloudmux {

struct UploadRequest {
    std::string parent_id;
    std::string name;
    uint64_t size = 0;
    ByteSource* source = nullptr;
    ProgressCallback progress;
    const std::atomic<bool>* cancel = nullptr;
};

struct UploadResult {
    bool success = false;
    RemoteFileHandle handle;
    bool rapid = false;
    uint64_t chunk_calls = 0;
    size_t peak_buffered = 0;
    bool full_hash_computed = false;
    TransferError error;
};

struct EngineStats {
    uint64_t uploads_ok = 0;
    uint64_t uploads_failed = 0;
    uint64_t rapid_uploads = 0;
    uint64_t chunk_calls = 0;
    uint64_t bytes_uploaded = 0;
    uint64_t bytes_downloaded = 0;
    uint64_t refreshes = 0;
    uint64_t auth_retries = 0;
    uint64_t requests = 0;
    std::array<uint64_t, 9> errors_by_kind{};  // indexed by ErrorKind
};

/// Moves bytes between local streams and one remote account.
///
/// Drivers compose an engine with their adapter and session; the engine
/// runs dedup negotiation, the chunked upload state machine and download
/// streams, and keeps counters. Independent transfers may run on separate
/// threads at the same time; they share only the credential session.
class TransferEngine {
public:
    TransferEngine(BackendAdapter adapter, std::shared_ptr<CredentialSession> session,
                   std::shared_ptr<net::HttpTransport> transport);

    UploadResult upload(const UploadRequest& request, UploadProtocol& protocol,
                        const DedupQueryFn& dedup_query = {});

    std::unique_ptr<DownloadStream> download(DownloadTarget target,
                                             std::optional<ByteRange> range = std::nullopt);

    /// Signed request/response call (listing, remove, mkdir, ...).
    ExecuteResult execute(const net::HttpRequest& request);
    ExecuteResult execute(const net::HttpRequest& request, const RequestSigner& signer);

    /// Override the adapter's chunk policy (0 = use the policy).
    void set_chunk_size_override(uint64_t bytes) { chunk_override_ = bytes; }
    void set_dedup_enabled(bool enabled) { adapter_.dedup.dedup_enabled = enabled; }

    uint64_t chunk_size_for(uint64_t file_size) const;

    const BackendAdapter& adapter() const { return adapter_; }
    const std::shared_ptr<CredentialSession>& session() const { return session_; }
    const std::shared_ptr<SignedExecutor>& executor() const { return executor_; }

    EngineStats stats() const;

private:
    UploadResult finish_upload(UploadResult result);
    void record_error(const TransferError& error);

    BackendAdapter adapter_;
    std::shared_ptr<CredentialSession> session_;
    std::shared_ptr<SignedExecutor> executor_;
    uint64_t chunk_override_ = 0;

    std::atomic<uint64_t> uploads_ok_{0};
    std::atomic<uint64_t> uploads_failed_{0};
    std::atomic<uint64_t> rapid_uploads_{0};
    std::atomic<uint64_t> chunk_calls_{0};
    std::atomic<uint64_t> bytes_uploaded_{0};
    std::atomic<uint64_t> bytes_downloaded_{0};
    std::array<std::atomic<uint64_t>, 9> errors_by_kind_{};
};

}  // namespace cloudmux
