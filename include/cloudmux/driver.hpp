#pragma once

#include "cloudmux/byte_source.hpp"
#include "cloudmux/credential_session.hpp"
#include "cloudmux/download_stream.hpp"
#include "cloudmux/error.hpp"
#include "cloudmux/net/http.hpp"
#include "cloudmux/remote_file.hpp"
#include "cloudmux/transfer_engine.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cloudmux {

struct UploadOptions {
    ProgressCallback progress;
    const std::atomic<bool>* cancel = nullptr;
};

struct DownloadResult {
    bool success = false;
    std::unique_ptr<DownloadStream> stream;
    TransferError error;
};

struct ListResult {
    bool success = false;
    std::vector<RemoteFileHandle> entries;
    TransferError error;
};

struct OperationResult {
    bool success = false;
    RemoteFileHandle handle;  // the created directory for mkdir
    TransferError error;
};

/// File operations on one remote account.
///
/// Every variant composes a TransferEngine for byte movement and signed
/// calls; drivers only map the provider's API onto these operations.
/// A download stream must not outlive the driver that opened it.
class Driver {
public:
    virtual ~Driver() = default;

    virtual std::string type_name() const = 0;

    virtual UploadResult upload(const std::string& parent_id, const std::string& name,
                                uint64_t size, ByteSource& source,
                                const UploadOptions& options = {}) = 0;

    virtual DownloadResult download(const RemoteFileHandle& file,
                                    std::optional<ByteRange> range = std::nullopt) = 0;

    virtual ListResult list(const std::string& dir_id) = 0;
    virtual OperationResult remove(const RemoteFileHandle& file) = 0;
    virtual OperationResult mkdir(const std::string& parent_id, const std::string& name) = 0;

    /// Link a client may fetch directly. nullopt when the backend must be
    /// proxied (proxy_required) or hands out no such link.
    virtual std::optional<std::string> direct_link(const RemoteFileHandle&) { return std::nullopt; }

    /// Directory id used when the caller names none.
    virtual std::string root_id() const = 0;

    virtual TransferEngine& engine() = 0;
    CredentialSession& session() { return *engine().session(); }
};

using DriverParams = std::map<std::string, std::string>;

class DriverFactory {
public:
    /// Build a driver of the given type. A null transport gets a libcurl
    /// HttpClient configured from the params and environment.
    /// Throws std::runtime_error when required params are missing.
    static std::unique_ptr<Driver> create(const std::string& type, const DriverParams& params,
                                          std::shared_ptr<net::HttpTransport> transport = nullptr);

    static std::vector<std::string> supported_types();

    /// Empty when the params are complete for `type`, otherwise why not.
    static std::string validate_params(const std::string& type, const DriverParams& params);
};

// Param helpers shared by the driver implementations
std::string param_or(const DriverParams& params, const std::string& key,
                     const std::string& fallback = {});
bool param_flag(const DriverParams& params, const std::string& key, bool fallback);
uint64_t param_u64(const DriverParams& params, const std::string& key, uint64_t fallback);

}  // namespace cloudmux
