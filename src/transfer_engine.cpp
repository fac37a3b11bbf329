#include "cloudmux/transfer_engine.hpp"
#include "cloudmux/log.hpp"

namespace cloudmux {

TransferEngine::TransferEngine(BackendAdapter adapter, std::shared_ptr<CredentialSession> session,
                               std::shared_ptr<net::HttpTransport> transport)
    : adapter_(std::move(adapter))
    , session_(std::move(session)) {
    if (!adapter_.signer) adapter_.signer = std::make_shared<UnsignedSigner>();
    if (!adapter_.chunk_policy) adapter_.chunk_policy = std::make_shared<FixedChunkPolicy>(10 * kMiB);
    executor_ = std::make_shared<SignedExecutor>(std::move(transport), session_,
                                                 adapter_.response_policy);
}

uint64_t TransferEngine::chunk_size_for(uint64_t file_size) const {
    return chunk_override_ > 0 ? chunk_override_ : adapter_.chunk_policy->chunk_size(file_size);
}

void TransferEngine::record_error(const TransferError& error) {
    auto index = static_cast<size_t>(error.kind);
    if (index < errors_by_kind_.size()) errors_by_kind_[index]++;
}

UploadResult TransferEngine::finish_upload(UploadResult result) {
    if (result.success) {
        uploads_ok_++;
        if (result.rapid) rapid_uploads_++;
    } else {
        uploads_failed_++;
        record_error(result.error);
    }
    chunk_calls_ += result.chunk_calls;
    return result;
}

UploadResult TransferEngine::upload(const UploadRequest& request, UploadProtocol& protocol,
                                    const DedupQueryFn& dedup_query) {
    UploadResult result;
    if (!request.source) {
        result.error = TransferError::make(ErrorKind::Precondition, "no source stream");
        return finish_upload(result);
    }
    if (auto known = request.source->size(); known && *known != request.size) {
        result.error = TransferError::make(
            ErrorKind::Precondition,
            "declared size " + std::to_string(request.size) + " but source has " +
                std::to_string(*known) + " bytes");
        return finish_upload(result);
    }

    const uint64_t chunk = chunk_size_for(request.size);
    // One chunk of resident memory per transfer, shared by hashing and upload
    std::vector<uint8_t> buffer(chunk);

    HashNegotiator negotiator(adapter_.dedup, buffer);
    DedupProbe probe = negotiator.probe(*request.source, request.size, request.name, dedup_query);
    result.full_hash_computed = probe.full_hash_computed;
    if (!probe.error.ok()) {
        log_error("Rapid upload check for %s failed: %s", request.name.c_str(),
                  probe.error.describe().c_str());
        result.error = probe.error;
        return finish_upload(result);
    }

    if (probe.matched) {
        result.success = true;
        result.rapid = true;
        result.handle.id = probe.answer.remote_id;
        result.handle.name = request.name;
        result.handle.parent_id = request.parent_id;
        result.handle.size = request.size;
        result.handle.checksum = probe.full_hash;
        if (request.progress) request.progress(request.size, request.size);
        log_info("Rapid upload of %s matched remote %s", request.name.c_str(),
                 result.handle.id.c_str());
        return finish_upload(result);
    }

    UploadSession session;
    session.parent_id = request.parent_id;
    session.name = request.name;
    session.total_size = request.size;
    session.chunk_size = chunk;
    if (!probe.partial_hash.empty()) session.attributes["partial_hash"] = probe.partial_hash;
    if (!probe.full_hash.empty()) session.attributes["full_hash"] = probe.full_hash;
    for (const auto& [key, value] : probe.answer.attributes) {
        session.attributes[key] = value;
    }

    std::optional<PrefixReplaySource> replay;
    ByteSource* source = request.source;
    if (!probe.captured_prefix.empty()) {
        replay.emplace(std::move(probe.captured_prefix), *request.source);
        source = &*replay;
    }

    ChunkedUpload upload(*executor_, protocol, std::move(session), buffer);
    upload.set_cancel_flag(request.cancel);
    upload.set_progress_callback(request.progress);

    auto fail = [&](TransferError error) {
        upload.abort();
        result.error = std::move(error);
        result.chunk_calls = upload.chunk_calls();
        result.peak_buffered = upload.peak_buffered();
        log_error("Upload of %s aborted: %s", request.name.c_str(), result.error.describe().c_str());
        return finish_upload(result);
    };

    if (auto err = upload.open(); !err.ok()) return fail(err);
    if (auto err = upload.pump(*source); !err.ok()) return fail(err);

    CommitResult commit = upload.finish();
    result.chunk_calls = upload.chunk_calls();
    result.peak_buffered = upload.peak_buffered();
    if (!commit.success) return fail(commit.error);

    bytes_uploaded_ += upload.bytes_written();
    result.success = true;
    result.handle = commit.handle;
    log_debug("Uploaded %s as %s in %lu parts", request.name.c_str(), result.handle.id.c_str(),
              static_cast<unsigned long>(result.chunk_calls));
    return finish_upload(result);
}

std::unique_ptr<DownloadStream> TransferEngine::download(DownloadTarget target,
                                                         std::optional<ByteRange> range) {
    DownloadOptions options;
    options.window_size = chunk_size_for(target.size.value_or(0));
    options.range = range;
    options.bytes_counter = &bytes_downloaded_;
    return open_download(executor_, adapter_.signer, std::move(target), std::move(options));
}

ExecuteResult TransferEngine::execute(const net::HttpRequest& request) {
    return execute(request, *adapter_.signer);
}

ExecuteResult TransferEngine::execute(const net::HttpRequest& request, const RequestSigner& signer) {
    auto result = executor_->execute(request, signer);
    if (!result.success) record_error(result.error);
    return result;
}

EngineStats TransferEngine::stats() const {
    EngineStats s;
    s.uploads_ok = uploads_ok_.load();
    s.uploads_failed = uploads_failed_.load();
    s.rapid_uploads = rapid_uploads_.load();
    s.chunk_calls = chunk_calls_.load();
    s.bytes_uploaded = bytes_uploaded_.load();
    s.bytes_downloaded = bytes_downloaded_.load();
    s.refreshes = session_->refresh_count();
    s.auth_retries = executor_->auth_retries();
    s.requests = executor_->attempts();
    for (size_t i = 0; i < s.errors_by_kind.size(); ++i) {
        s.errors_by_kind[i] = errors_by_kind_[i].load();
    }
    return s;
}

}  // namespace cloudmux
